#include "pipeline_helpers.hpp"
#include "../preflight.hpp"
#include "../theme.hpp"
#include <managers/mirror.hpp>
#include <platform/store_lock.hpp>
#include <iostream>
#include <optional>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path require_archive_root(const Config& config, const std::string& volume) {
    if (report_issues(check_volume(config, volume, "archive"))) return {};

    fs::path root = config.archive_root(volume);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        std::cout << theme::fail("No archive directory found at " + root.string());
        return {};
    }
    return root;
}

int mirror_archives(const Config& config, const std::string& from,
                    const std::string& to, bool dry_run) {
    if (from == to) {
        std::cout << theme::fail("Primary and mirror must be different volumes.");
        return 1;
    }
    if (report_issues(check_volume(config, to, "mirror"))) return 1;
    if (!dry_run && report_issues(check_writable(config.volume_path(to)))) return 1;

    fs::path src = require_archive_root(config, from);
    if (src.empty()) return 1;
    fs::path dst = config.archive_root(to);

    auto transport = make_mirror_transport(config.mirror());
    if (config.mirror().tool == "rsync" && report_issues(check_tools({"rsync"}))) return 1;

    // The mirror is a second archive; guard it the way the primary is guarded
    std::optional<StoreLock> lock;
    if (!dry_run) {
        lock.emplace(dst.string());
        lock->require();
    }

    if (dry_run) std::cout << theme::warn("[DRY RUN] No files will be copied.");
    std::cout << "\n";

    MirrorPropagator propagator(*transport);
    int status = propagator.propagate(src, dst, dry_run,
        [](const std::string& msg) { std::cout << theme::info(msg); });

    std::cout << "\n";
    if (status == 0) {
        std::cout << theme::ok("Sync complete.");
    } else {
        std::cout << theme::fail(fmt::format("{} exited with code {}", config.mirror().tool, status));
    }
    return status;
}

static int do_sync(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_command_args(args, {"--from", "--to"}, {"--dry-run"});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    if (!cli.require_config()) return 1;

    const Config& config = cli.config.value();
    std::string from = parsed.value.get("--from", config.volumes().archive);
    std::string to = parsed.value.get("--to", config.volumes().mirror);

    std::cout << theme::section("Archive Sync: Primary -> Mirror");

    if (from.empty() || to.empty()) {
        std::cout << theme::fail("Both a primary and a mirror volume are needed.");
        std::cout << theme::step("Pass --from/--to or set volumes.archive and volumes.mirror");
        return 1;
    }
    return mirror_archives(config, from, to, parsed.value.has("--dry-run")) == 0 ? 0 : 1;
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("sync", do_sync, "Copy new archive files to the mirror volume");
}
