#include "pipeline_helpers.hpp"
#include "../preflight.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/state_store.hpp>
#include <managers/upload_tracker.hpp>
#include <platform/store_lock.hpp>
#include <iostream>
#include <optional>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Numbered list of pending units; the operator picks with "1,3-5" or "all".
static std::vector<TransferUnit> select_interactively(const UploadTracker& tracker) {
    auto pending = tracker.list_pending();
    if (pending.empty()) return {};

    std::cout << theme::section("Pending folders");
    for (size_t i = 0; i < pending.size(); i++) {
        std::cout << fmt::format("    {:>3}. {} ", i + 1, pending[i].key)
                  << theme::dim(fmt::format("({} files)", UploadTracker::file_count(pending[i].path)))
                  << "\n";
    }
    std::cout << "\n    Select folders to upload (e.g. 1,3-5 or all): " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) return {};

    auto picked = parse_selection(line, pending.size());
    if (picked.is_err()) {
        std::cout << theme::fail(picked.error);
        return {};
    }

    std::vector<TransferUnit> units;
    for (size_t idx : picked.value) units.push_back(pending[idx]);
    return units;
}

static int do_upload(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_command_args(args, {"--archive", "--date"},
                                     {"--all", "--retry-failed", "--force", "--dry-run"});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    if (!cli.require_config()) return 1;

    const auto& opts = parsed.value;
    const Config& config = cli.config.value();
    bool dry_run = opts.has("--dry-run");

    if (report_issues(check_upload_config(config))) return 1;
    if (report_issues(check_tools({config.upload().client}))) return 1;

    std::cout << theme::section("Photo Upload: Archive -> Server");
    if (dry_run) std::cout << theme::warn("[DRY RUN] The upload client runs in dry-run mode; state is not recorded.");

    fs::path archive_root = require_archive_root(config, opts.get("--archive", config.volumes().archive));
    if (archive_root.empty()) return 1;

    std::optional<StoreLock> lock;
    if (!dry_run) {
        lock.emplace(config.upload_state_path().string());
        lock->require();
    }

    UploadStateStore state(config.upload_state_path());
    UploadTracker tracker(state, archive_root);

    auto interrupted = tracker.list_interrupted();
    if (!interrupted.empty()) {
        std::cout << theme::warn(fmt::format("{} upload(s) were interrupted and are pending again:",
                                             interrupted.size()));
        for (const auto& u : interrupted) std::cout << theme::dim("      " + u.key) << "\n";
    }

    std::vector<TransferUnit> units;
    if (opts.has("--force")) {
        std::cout << theme::warn("Force mode: ignoring upload state, the server skips duplicates.");
        units = tracker.select(UploadMode::ForceAll);
    } else if (opts.options.count("--date")) {
        std::string key = opts.get("--date");
        if (!UploadTracker::normalize_unit_key(key)) {
            std::cout << theme::fail("Not a date folder key (YYYY/MM/DD): " + key);
            return 1;
        }
        units = tracker.select(UploadMode::SingleUnit, key);
        if (units.empty()) {
            std::cout << theme::fail("Folder not found: " + (archive_root / key).string());
            return 1;
        }
    } else if (opts.has("--retry-failed")) {
        units = tracker.select(UploadMode::RetryFailed);
    } else if (opts.has("--all")) {
        units = tracker.select(UploadMode::AllPending);
    } else {
        units = select_interactively(tracker);
    }

    if (units.empty()) {
        std::cout << theme::info("Nothing to upload.");
        return 0;
    }

    std::cout << "\n" << theme::info(fmt::format("Uploading {} folder(s) to {}",
                                                 units.size(), config.server().url)) << "\n";

    ExternalUploadClient client(config.server(), config.upload(), dry_run);
    auto summary = tracker.run(units, client, config.log_dir(), !dry_run,
        [](const std::string& msg) { std::cout << theme::step(msg); });

    for (const auto& r : summary.results) {
        if (r.status == UploadStatus::Uploaded) {
            std::cout << theme::ok(fmt::format("Done: {} ({} files)", r.unit.key, r.file_count));
        } else if (!r.error.empty()) {
            std::cout << theme::fail(fmt::format("Failed: {} ({})", r.unit.key, r.error));
        } else {
            std::cout << theme::fail(fmt::format("Failed: {} (exit code {})", r.unit.key, r.exit_code));
            std::cout << theme::dim("      Log file: " + r.log_path.string()) << "\n";
        }
    }

    std::cout << theme::section("Summary");
    std::cout << theme::ok(fmt::format("Uploaded: {} folder(s)", summary.uploaded));
    if (summary.failed > 0) {
        std::cout << theme::fail(fmt::format("Failed:   {} folder(s)", summary.failed));
        std::cout << theme::dim("    Retry with: shutterbox upload --retry-failed") << "\n";
        return 1;
    }
    return 0;
}

void register_upload_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload, "Send archive date folders to the photo server");
}
