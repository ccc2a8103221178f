#include "upload_tracker.hpp"
#include "ingest.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>

// ── ExternalUploadClient ─────────────────────────────────────

ExternalUploadClient::ExternalUploadClient(const ServerConfig& server,
                                           const UploadConfig& upload, bool dry_run)
    : server_(server), upload_(upload), dry_run_(dry_run) {}

std::vector<std::string> ExternalUploadClient::build_args(const fs::path& unit_dir,
                                                          const fs::path& log_file) const {
    std::vector<std::string> args = {
        "upload", "from-folder",
        "--server=" + server_.url,
        "--api-key=" + server_.api_key,
        "--recursive",
    };
    if (!upload_.include.empty()) {
        args.push_back("--include-extensions=" + join_csv(upload_.include));
    }
    if (!upload_.exclude.empty()) {
        args.push_back("--exclude-extensions=" + join_csv(upload_.exclude));
    }
    if (upload_.pause_jobs) {
        args.push_back("--pause-immich-jobs");
    }
    args.push_back(fmt::format("--concurrent-tasks={}", upload_.concurrent_tasks));
    args.push_back("--log-file=" + log_file.string());
    if (dry_run_) {
        args.push_back("--dry-run");
    }
    args.push_back(unit_dir.string());
    return args;
}

ProcessResult ExternalUploadClient::upload(const fs::path& unit_dir, const fs::path& log_file) {
    auto args = build_args(unit_dir, log_file);
    log_debug("running {} upload from-folder ... {}", upload_.client, unit_dir.string());

    ProcessResult result;
    result.exit_code = platform::run(upload_.client, args);
    result.log_path = log_file.string();
    return result;
}

// ── UploadTracker ────────────────────────────────────────────

UploadTracker::UploadTracker(UploadStateStore& store, const fs::path& archive_root)
    : store_(store), archive_root_(archive_root) {}

TransferUnit UploadTracker::unit_from_key(const std::string& key) const {
    return TransferUnit{key, archive_root_ / fs::path(key)};
}

std::vector<TransferUnit> UploadTracker::list_units() const {
    std::vector<TransferUnit> units;
    std::error_code ec;
    if (!fs::is_directory(archive_root_, ec)) return units;

    auto it = fs::recursive_directory_iterator(
        archive_root_, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it.depth() + 1 < BUCKET_DEPTH) continue;
        // Never look inside a bucket
        it.disable_recursion_pending();
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            std::string key = it->path().lexically_relative(archive_root_).generic_string();
            units.push_back(TransferUnit{key, it->path()});
        }
    }
    if (ec) {
        log_warn("listing units under {}: {}", archive_root_.string(), ec.message());
    }

    std::sort(units.begin(), units.end(), [](const TransferUnit& a, const TransferUnit& b) {
        return a.key < b.key;
    });
    return units;
}

std::vector<TransferUnit> UploadTracker::list_pending() const {
    std::set<std::string> uploaded;
    for (const auto& r : store_.list_by_status(UploadStatus::Uploaded)) {
        uploaded.insert(r.unit_key);
    }

    std::vector<TransferUnit> pending;
    for (auto& u : list_units()) {
        if (!uploaded.count(u.key)) pending.push_back(std::move(u));
    }
    return pending;
}

std::vector<TransferUnit> UploadTracker::units_with_status(UploadStatus status) const {
    std::vector<TransferUnit> units;
    for (const auto& r : store_.list_by_status(status)) {
        units.push_back(unit_from_key(r.unit_key));
    }
    return units;
}

std::vector<TransferUnit> UploadTracker::list_failed() const {
    return units_with_status(UploadStatus::Failed);
}

std::vector<TransferUnit> UploadTracker::list_interrupted() const {
    return units_with_status(UploadStatus::InProgress);
}

std::optional<std::string> UploadTracker::normalize_unit_key(const std::string& key) {
    std::string normal = fs::path(key).lexically_normal().generic_string();
    while (!normal.empty() && normal.back() == '/') normal.pop_back();
    if (!is_valid_bucket_key(normal)) return std::nullopt;
    return normal;
}

std::optional<TransferUnit> UploadTracker::unit_for_key(const std::string& key) const {
    auto normal = normalize_unit_key(key);
    if (!normal) return std::nullopt;

    TransferUnit unit = unit_from_key(*normal);
    std::error_code ec;
    if (!fs::is_directory(unit.path, ec)) return std::nullopt;
    return unit;
}

std::vector<TransferUnit> UploadTracker::select(UploadMode mode, const std::string& key) const {
    switch (mode) {
        case UploadMode::AllPending:
            return list_pending();
        case UploadMode::ForceAll:
            return list_units();
        case UploadMode::SingleUnit: {
            auto unit = unit_for_key(key);
            if (!unit) return {};
            return {*unit};
        }
        case UploadMode::RetryFailed: {
            std::vector<TransferUnit> units;
            for (auto& u : list_failed()) {
                std::error_code ec;
                if (fs::is_directory(u.path, ec)) {
                    units.push_back(std::move(u));
                } else {
                    log_warn("failed unit {} no longer exists, not retrying", u.key);
                }
            }
            return units;
        }
    }
    return {};
}

int UploadTracker::file_count(const fs::path& unit_dir) {
    int count = 0;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(
        unit_dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) count++;
    }
    return count;
}

UnitResult UploadTracker::run_unit(const TransferUnit& unit, UploadClient& client,
                                   const fs::path& log_dir, bool record_state) {
    UnitResult result;
    result.unit = unit;
    result.file_count = file_count(unit.path);

    std::error_code ec;
    fs::create_directories(log_dir, ec);
    // One log per unit even when several finish within the same second
    std::string key_part = unit.key;
    std::replace(key_part.begin(), key_part.end(), '/', '-');
    result.log_path = log_dir / fmt::format("upload-{}-{}.log", now_compact(), key_part);

    UploadStateRecord rec;
    rec.unit_key = unit.key;
    rec.file_count = result.file_count;

    if (record_state) {
        // Written before the attempt so a crash leaves the unit visibly interrupted
        rec.status = UploadStatus::InProgress;
        rec.timestamp = now_iso();
        store_.upsert(rec);
    }

    ProcessResult pr = client.upload(unit.path, result.log_path);
    result.exit_code = pr.exit_code;
    if (!pr.log_path.empty()) result.log_path = pr.log_path;

    if (pr.success()) {
        result.status = UploadStatus::Uploaded;
        log_info("uploaded {} ({} files)", unit.key, result.file_count);
    } else {
        result.status = UploadStatus::Failed;
        log_error("RemoteFailure: upload of {} exited {} (log: {})",
                  unit.key, pr.exit_code, result.log_path.string());
    }

    if (record_state) {
        rec.status = result.status;
        rec.timestamp = now_iso();
        rec.exit_code = std::to_string(pr.exit_code);
        store_.upsert(rec);
    }
    return result;
}

UploadSummary UploadTracker::run(const std::vector<TransferUnit>& units, UploadClient& client,
                                 const fs::path& log_dir, bool record_state, StatusCallback cb) {
    UploadSummary summary;
    for (const auto& unit : units) {
        if (cb) cb(fmt::format("Uploading {}", unit.key));

        UnitResult result;
        try {
            result = run_unit(unit, client, log_dir, record_state);
        } catch (const PipelineError& e) {
            result.unit = unit;
            result.status = UploadStatus::Failed;
            result.error = e.what();
            log_error("{}: {}", error_kind_name(e.kind()), e.what());
        } catch (const fs::filesystem_error& e) {
            result.unit = unit;
            result.status = UploadStatus::Failed;
            result.error = e.what();
            log_error("IOError: {}", e.what());
        }

        if (result.status == UploadStatus::Uploaded) {
            summary.uploaded++;
        } else {
            summary.failed++;
        }
        summary.results.push_back(std::move(result));
    }
    return summary;
}
