#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "state_store.hpp"

namespace fs = std::filesystem;

// A date bucket of the archive: <archive_root>/YYYY/MM/DD.
struct TransferUnit {
    std::string key;                // "YYYY/MM/DD"
    fs::path path;
};

// The remote side. Uploads one unit directory; the client does its own
// server-side dedup, so re-sending a unit is harmless.
class UploadClient {
public:
    virtual ~UploadClient() = default;
    virtual ProcessResult upload(const fs::path& unit_dir, const fs::path& log_file) = 0;
};

// Runs `<client> upload from-folder ...` as a child process.
class ExternalUploadClient : public UploadClient {
public:
    ExternalUploadClient(const ServerConfig& server, const UploadConfig& upload, bool dry_run);

    ProcessResult upload(const fs::path& unit_dir, const fs::path& log_file) override;

    // Argument vector passed to the client (without the program name).
    std::vector<std::string> build_args(const fs::path& unit_dir, const fs::path& log_file) const;

private:
    const ServerConfig& server_;
    const UploadConfig& upload_;
    bool dry_run_;
};

enum class UploadMode {
    AllPending,
    SingleUnit,
    RetryFailed,
    ForceAll,
};

struct UnitResult {
    TransferUnit unit;
    UploadStatus status = UploadStatus::Failed;
    int file_count = 0;
    int exit_code = -1;
    fs::path log_path;
    std::string error;              // state write failures and the like
};

struct UploadSummary {
    size_t uploaded = 0;
    size_t failed = 0;
    std::vector<UnitResult> results;
};

// Per-unit upload state machine over the archive's date buckets:
// pending/failed -> in_progress -> uploaded | failed.
class UploadTracker {
public:
    UploadTracker(UploadStateStore& store, const fs::path& archive_root);

    // Every directory exactly BUCKET_DEPTH levels below the root, sorted.
    std::vector<TransferUnit> list_units() const;

    // Existing units whose last status is not uploaded.
    std::vector<TransferUnit> list_pending() const;

    // Units whose last status is failed / in_progress (path may no longer exist).
    std::vector<TransferUnit> list_failed() const;
    std::vector<TransferUnit> list_interrupted() const;

    // "2024/05/01/", "./2024/05/01" -> "2024/05/01". nullopt unless the
    // result is a valid YYYY/MM/DD bucket key.
    static std::optional<std::string> normalize_unit_key(const std::string& key);

    // Existing unit for a key, nullopt if the key is not a bucket key or
    // there is no such directory.
    std::optional<TransferUnit> unit_for_key(const std::string& key) const;

    // Units chosen by a mode. key is used only by SingleUnit; RetryFailed
    // drops units whose directory is gone.
    std::vector<TransferUnit> select(UploadMode mode, const std::string& key = "") const;

    static int file_count(const fs::path& unit_dir);

    // Mark in_progress, run the client, record uploaded or failed.
    // record_state=false runs the client without touching the store (dry run).
    UnitResult run_unit(const TransferUnit& unit, UploadClient& client,
                        const fs::path& log_dir, bool record_state = true);

    // run_unit over every unit; one unit's failure never stops the rest.
    UploadSummary run(const std::vector<TransferUnit>& units, UploadClient& client,
                      const fs::path& log_dir, bool record_state = true,
                      StatusCallback cb = nullptr);

    const fs::path& archive_root() const { return archive_root_; }

private:
    TransferUnit unit_from_key(const std::string& key) const;
    std::vector<TransferUnit> units_with_status(UploadStatus status) const;

    UploadStateStore& store_;
    fs::path archive_root_;
};
