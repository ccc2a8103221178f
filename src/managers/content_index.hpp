#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// One archived piece of content. Never edited once written.
struct ContentRecord {
    std::string digest;         // SHA-256 hex, unique
    std::string source_path;    // advisory; UNKNOWN_ORIGIN after a rebuild
    std::string dest_path;      // archive location, unique
    std::string recorded_at;    // ISO timestamp
    uint64_t size = 0;
};

// A line of a persisted index that could not be parsed.
struct CorruptEntry {
    size_t line_number = 0;
    std::string reason;
};

// Storage backend for the dedup store: exact lookups by digest and by
// destination, append, and whole-store replacement.
class ContentIndex {
public:
    virtual ~ContentIndex() = default;

    virtual std::optional<ContentRecord> find(const std::string& digest) const = 0;
    virtual bool has_destination(const std::string& dest_path) const = 0;
    virtual void append(const ContentRecord& record) = 0;
    virtual void replace_all(const std::vector<ContentRecord>& records) = 0;
    virtual size_t size() const = 0;
};

// Hash-indexed records held in memory only.
class MemoryContentIndex : public ContentIndex {
public:
    std::optional<ContentRecord> find(const std::string& digest) const override;
    bool has_destination(const std::string& dest_path) const override;
    void append(const ContentRecord& record) override;
    void replace_all(const std::vector<ContentRecord>& records) override;
    size_t size() const override { return by_digest_.size(); }

protected:
    // Insert into the maps; returns false if digest or destination is taken.
    bool insert(const ContentRecord& record);
    void clear();

private:
    std::unordered_map<std::string, ContentRecord> by_digest_;
    std::unordered_set<std::string> destinations_;
};

// Append-only tab-separated log, loaded into memory on open:
//   digest \t source_path \t dest_path \t recorded_at \t size
class LogContentIndex : public MemoryContentIndex {
public:
    explicit LogContentIndex(const fs::path& log_path);

    void append(const ContentRecord& record) override;

    // Back up the current log to <log>.bak, then atomically swap in a log
    // holding exactly `records`.
    void replace_all(const std::vector<ContentRecord>& records) override;

    const fs::path& path() const { return log_path_; }

    // Lines skipped while loading.
    const std::vector<CorruptEntry>& corrupt_entries() const { return corrupt_; }

    // Strict re-read of a log file; every malformed or conflicting line is reported.
    static std::vector<CorruptEntry> validate(const fs::path& log_path);

    static std::string format_line(const ContentRecord& record);

    // Parse one log line. Returns nullopt and sets `reason` if malformed.
    static std::optional<ContentRecord> parse_line(const std::string& line, std::string& reason);

private:
    void load();

    fs::path log_path_;
    std::vector<CorruptEntry> corrupt_;
};
