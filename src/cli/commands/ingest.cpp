#include "pipeline_helpers.hpp"
#include "../preflight.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/copy_engine.hpp>
#include <managers/dedup_store.hpp>
#include <managers/hasher.hpp>
#include <managers/ingest.hpp>
#include <platform/store_lock.hpp>
#include <iostream>
#include <mutex>
#include <optional>
#include <fmt/format.h>

namespace fs = std::filesystem;

static bool archive_has_files(const fs::path& root) {
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(
        root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) return true;
    }
    return false;
}

static void print_rebuild_summary(const RebuildSummary& s) {
    std::cout << theme::ok(fmt::format("Rebuilt: {} of {} files recorded", s.records, s.files_found));
    if (s.duplicate_content > 0) {
        std::cout << theme::warn(fmt::format("{} files repeat content recorded at another path",
                                             s.duplicate_content));
    }
    if (s.unreadable > 0) {
        std::cout << theme::fail(fmt::format("{} files could not be read", s.unreadable));
    }
}

static void print_step(const std::string& msg) {
    std::cout << theme::step(msg);
}

static int do_ingest(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_command_args(args, {"--source", "--archive"},
                                     {"--dry-run", "--ignore-space", "--rebuild-if-empty"});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    if (!cli.require_config()) return 1;

    const auto& opts = parsed.value;
    bool dry_run = opts.has("--dry-run");
    Config config = cli.config->with_volumes(opts.get("--source"), opts.get("--archive"), "");
    const auto& vols = config.volumes();

    std::cout << theme::section("Photo Ingest: Card -> Archive");

    // Nothing is written before these checks pass
    std::vector<PreflightIssue> issues = check_volume(config, vols.source, "source");
    auto more = check_volume(config, vols.archive, "archive");
    issues.insert(issues.end(), more.begin(), more.end());
    if (report_issues(issues)) return 1;

    fs::path source_root = config.source_root(vols.source);
    fs::path archive_root = config.archive_root(vols.archive);
    std::error_code ec;
    if (!fs::is_directory(source_root, ec)) {
        std::cout << theme::fail(vols.source_subdir + " directory not found at " + source_root.string());
        return 1;
    }
    if (!dry_run && report_issues(check_writable(config.volume_path(vols.archive)))) return 1;
    auto tool_issues = check_tools({"exiftool"});
    for (auto& issue : tool_issues) {
        issue.is_hint = true;
        issue.fix = "Without exiftool files are bucketed by modification date";
    }
    report_issues(tool_issues);

    std::optional<StoreLock> lock;
    if (!dry_run) {
        lock.emplace(config.hash_db_path().string());
        lock->require();
    }

    DedupStore store = DedupStore::open(config.hash_db_path());
    Hasher hasher(static_cast<unsigned>(config.ingest().hash_workers));

    if (store.count() == 0 && archive_has_files(archive_root)) {
        std::cout << theme::warn("Hash database is empty but the archive already has files.");
        if (opts.has("--rebuild-if-empty") && !dry_run) {
            std::cout << theme::step("Rebuilding hash database from " + archive_root.string());
            print_rebuild_summary(store.rebuild(archive_root, hasher, print_step));
            std::cout << "\n";
        } else {
            std::cout << theme::step("Run 'shutterbox rehash' or pass --rebuild-if-empty, "
                                     "otherwise existing files will be copied again");
        }
    }

    std::cout << theme::info("Source: " + source_root.string());
    std::cout << theme::info("Target: " + archive_root.string());
    if (dry_run) std::cout << theme::warn("[DRY RUN] No files will be copied.");
    std::cout << "\n" << theme::step("Scanning files...");

    auto files = scan(source_root, config.ingest().include, config.ingest().exclude).collect();
    if (files.empty()) {
        std::cout << theme::info("No matching files found on the card.");
        return 0;
    }

    uint64_t total_bytes = 0;
    for (const auto& f : files) {
        auto size = fs::file_size(f, ec);
        if (!ec) total_bytes += size;
    }
    std::cout << theme::info(fmt::format("Found {} files ({})", files.size(), human_size(total_bytes)));

    if (!dry_run && !opts.has("--ignore-space")) {
        if (report_issues(check_free_space(config.volume_path(vols.archive), total_bytes))) return 1;
    }

    std::cout << theme::step(fmt::format("Pre-hashing source files ({} workers)...", hasher.workers()));
    std::mutex progress_mutex;
    auto hashes = hasher.digest_batch(files, [&](size_t done, size_t total) {
        std::lock_guard<std::mutex> guard(progress_mutex);
        std::cout << theme::progress(done, total, "hashing") << std::flush;
    });
    std::cout << theme::progress_done();
    std::cout << theme::ok(fmt::format("Hashing complete ({} of {} files).", hashes.size(), files.size()));
    std::cout << "\n";

    ExiftoolExtractor extractor;
    DateBucketer bucketer(&extractor);
    CopyEngine engine(store, bucketer, archive_root, dry_run);

    auto summary = engine.run(files, hashes, [&](size_t i, size_t n, const CopyOutcome& out) {
        std::cout << theme::progress(i, n, out.source.filename().string()) << std::flush;
        if (out.status == CopyStatus::WouldCopy) {
            std::cout << theme::progress_done()
                      << theme::info(fmt::format("[dry-run] Would copy: {} -> {} ({})",
                                                 out.source.string(), out.destination.string(),
                                                 human_size(out.size)));
        } else if (out.status == CopyStatus::Recovered) {
            std::cout << theme::progress_done()
                      << theme::info(fmt::format("{}Already in archive, unrecorded: {}",
                                                 dry_run ? "[dry-run] " : "",
                                                 out.destination.string()));
        }
    });
    std::cout << theme::progress_done();

    std::cout << theme::section("Summary");
    if (dry_run) {
        std::cout << theme::ok(fmt::format("Would copy: {} files ({})",
                                           summary.would_copy, human_size(summary.would_copy_bytes)));
    } else {
        std::cout << theme::ok(fmt::format("Copied:  {} files ({})",
                                           summary.copied, human_size(summary.copied_bytes)));
    }
    if (summary.skipped > 0) {
        std::cout << theme::dim(fmt::format("    Skipped: {} (already backed up)", summary.skipped)) << "\n";
    }
    if (summary.recovered > 0) {
        std::cout << theme::dim(fmt::format("    Recorded without copying: {} (left by an interrupted run)",
                                            summary.recovered)) << "\n";
    }
    if (summary.errors > 0) {
        std::cout << theme::fail(fmt::format("Errors:  {}", summary.errors));
        for (const auto& f : summary.failures) {
            std::cout << theme::step(fmt::format("{}: {}", error_kind_name(f.error_kind), f.error));
        }
    }
    std::cout << "\n" << theme::info(fmt::format("Hash DB: {} total files tracked", store.count()));

    int status = summary.errors > 0 ? 1 : 0;

    if (!vols.mirror.empty()) {
        std::error_code mec;
        if (fs::is_directory(config.volume_path(vols.mirror), mec)) {
            std::cout << "\n" << theme::info("Mirror '" + vols.mirror + "' detected, syncing...");
            lock.reset();
            if (mirror_archives(config, vols.archive, vols.mirror, dry_run) != 0) status = 1;
        } else {
            std::cout << "\n" << theme::dim("    Mirror '" + vols.mirror + "' not mounted, skipping sync.") << "\n";
        }
    }
    return status;
}

static int do_rehash(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_command_args(args, {"--archive"}, {});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    if (!cli.require_config()) return 1;

    const Config& config = cli.config.value();
    std::string volume = parsed.value.get("--archive", config.volumes().archive);

    std::cout << theme::section("Rebuild Hash Database");

    fs::path archive_root = require_archive_root(config, volume);
    if (archive_root.empty()) return 1;

    StoreLock lock(config.hash_db_path().string());
    lock.require();

    DedupStore store = DedupStore::open(config.hash_db_path());
    Hasher hasher(static_cast<unsigned>(config.ingest().hash_workers));
    std::cout << theme::info(fmt::format("Using {} hash workers", hasher.workers()));

    auto summary = store.rebuild(archive_root, hasher, print_step);
    print_rebuild_summary(summary);
    std::cout << theme::dim("    Previous database kept as " + config.hash_db_path().string() + ".bak") << "\n";
    return summary.unreadable > 0 ? 1 : 0;
}

void register_ingest_commands(BaseCLI& cli) {
    cli.add_command("ingest", do_ingest, "Copy new photos from the card into the archive");
    cli.add_command("rehash", do_rehash, "Rebuild the hash database from the archive");
}
