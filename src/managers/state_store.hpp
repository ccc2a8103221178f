#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

enum class UploadStatus {
    Pending,        // implicit: no record for the unit
    InProgress,
    Uploaded,
    Failed,
};

// "in_progress", "uploaded", "failed" ("pending" for the implicit state).
const char* upload_status_name(UploadStatus status);

// Persisted states only; "pending" and anything unknown return nullopt.
std::optional<UploadStatus> parse_upload_status(const std::string& s);

struct UploadStateRecord {
    UploadStatus status = UploadStatus::Pending;
    std::string unit_key;           // YYYY/MM/DD
    std::string timestamp;          // ISO, time of the transition
    int file_count = 0;
    std::string exit_code;          // "" or the client's non-zero exit status
};

// A record (by position in `units:`) that failed strict validation.
struct StateProblem {
    size_t index = 0;
    std::string reason;
};

// Last-known upload status per unit, persisted as YAML:
//   units:
//     - {status, unit_key, timestamp, file_count, exit_code}
class UploadStateStore {
public:
    explicit UploadStateStore(const fs::path& state_path);

    // Current records, one per unit key. Malformed records are skipped.
    std::vector<UploadStateRecord> load() const;

    std::optional<UploadStateRecord> get(const std::string& unit_key) const;

    // Replace the record for exactly this key (or add it). Written to a temp
    // file and renamed over the store. Upserting Pending drops the record.
    void upsert(const UploadStateRecord& record);

    std::vector<UploadStateRecord> list_by_status(UploadStatus status) const;
    size_t count_by_status(UploadStatus status) const;
    long files_by_status(UploadStatus status) const;

    // Strict re-read: every malformed or duplicated record is reported.
    static std::vector<StateProblem> validate(const fs::path& state_path);

    const fs::path& path() const { return state_path_; }

private:
    // parsed=false if the document itself could not be read as YAML.
    std::vector<UploadStateRecord> read_records(bool& parsed) const;
    void write_records(const std::vector<UploadStateRecord>& records) const;

    fs::path state_path_;
};
