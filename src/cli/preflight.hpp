#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Volume is configured and its mount point exists.
std::vector<PreflightIssue> check_volume(const Config& config,
                                         const std::string& volume,
                                         const std::string& role);

std::vector<PreflightIssue> check_writable(const std::filesystem::path& dir);

// needed_bytes must fit in the free space of the filesystem holding dir.
std::vector<PreflightIssue> check_free_space(const std::filesystem::path& dir,
                                             uint64_t needed_bytes);

// External programs resolvable on PATH.
std::vector<PreflightIssue> check_tools(const std::vector<std::string>& programs);

std::vector<PreflightIssue> check_upload_config(const Config& config);

// Print issues; returns true if any of them is an error.
bool report_issues(const std::vector<PreflightIssue>& issues);
