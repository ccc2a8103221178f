#include "preflight.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::vector<PreflightIssue> check_volume(const Config& config,
                                         const std::string& volume,
                                         const std::string& role) {
    std::vector<PreflightIssue> issues;

    if (volume.empty()) {
        issues.push_back({
            fmt::format("No {} volume configured", role),
            fmt::format("Set volumes.{} in {} or pass it on the command line",
                        role, get_config_path(config.home()).string())
        });
        return issues;
    }

    fs::path mount = config.volume_path(volume);
    std::error_code ec;
    if (!fs::is_directory(mount, ec)) {
        issues.push_back({
            fmt::format("Volume '{}' is not mounted ({} not found)", volume, mount.string()),
            "Connect the drive and try again"
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_writable(const fs::path& dir) {
    std::vector<PreflightIssue> issues;
    if (!platform::is_writable(dir)) {
        issues.push_back({
            fmt::format("{} is not writable", dir.string()),
            "Check the volume is not mounted read-only"
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_free_space(const fs::path& dir, uint64_t needed_bytes) {
    std::vector<PreflightIssue> issues;
    uint64_t avail = platform::available_bytes(dir);
    if (needed_bytes > avail) {
        issues.push_back({
            fmt::format("Files require {} but {} has {} free",
                        human_size(needed_bytes), dir.string(), human_size(avail)),
            "Free up space or pass --ignore-space"
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_tools(const std::vector<std::string>& programs) {
    std::vector<PreflightIssue> issues;
    for (const auto& p : programs) {
        if (!platform::program_available(p)) {
            issues.push_back({fmt::format("'{}' is not installed", p), "Install it and make sure it is on PATH"});
        }
    }
    return issues;
}

std::vector<PreflightIssue> check_upload_config(const Config& config) {
    std::vector<PreflightIssue> issues;
    for (const auto& problem : config.validate_upload()) {
        issues.push_back({"Server details missing: " + problem,
                          "Edit " + get_config_path(config.home()).string()});
    }
    return issues;
}

bool report_issues(const std::vector<PreflightIssue>& issues) {
    bool has_error = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            has_error = true;
        }
        if (!issue.fix.empty()) std::cout << theme::step(issue.fix);
    }
    return has_error;
}
