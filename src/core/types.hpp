#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External tool execution result
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string log_path;           // tool's own log artifact, if any

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct ServerConfig {
    std::string url;
    std::string api_key;
};

struct VolumeConfig {
    std::string mount_root = "/Volumes";
    std::string source;                 // removable media (SD card)
    std::string archive;                // primary archive SSD
    std::string mirror;                 // optional secondary archive
    std::string source_subdir = "DCIM";
    std::string archive_subdir = "full_dump";
};

struct IngestConfig {
    std::vector<std::string> include;   // normalized ".ext", lower case
    std::vector<std::string> exclude;
    int hash_workers = 0;               // 0 = detected CPU count
};

struct UploadConfig {
    std::string client = "immich-go";
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    int concurrent_tasks = 4;
    bool pause_jobs = true;
};

struct MirrorConfig {
    std::string tool = "rsync";         // "rsync" or "builtin"
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
