#pragma once

#include <string>
#include <memory>
#include <optional>
#include <unordered_set>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include "content_index.hpp"
#include "hasher.hpp"

namespace fs = std::filesystem;

// Where a new file should go. unrecorded_copy is set when the path already
// holds these exact bytes but was never recorded (a run stopped between
// verifying a copy and recording it).
struct Placement {
    fs::path path;
    bool unrecorded_copy = false;
};

struct RebuildSummary {
    size_t files_found = 0;
    size_t records = 0;
    size_t unreadable = 0;
    size_t duplicate_content = 0;   // identical bytes at a second path
};

// Content-addressed record of everything ever archived. Answers "seen this
// content before?" and hands out destination names that never overwrite.
class DedupStore {
public:
    explicit DedupStore(std::unique_ptr<ContentIndex> index);

    // Store backed by the append-only log at db_path.
    static DedupStore open(const fs::path& db_path);

    // Exact digest match only.
    bool exists(const ContentHash& digest) const;

    std::optional<fs::path> recorded_destination(const ContentHash& digest) const;

    // True if the path is recorded OR a file already sits there on disk.
    bool destination_exists(const fs::path& path) const;

    // dest_dir/base_name+ext, or the first free base_name_N+ext for N = 2, 3, ...
    // ext includes its dot ("" for none). Throws CollisionExhausted past the bound.
    fs::path resolve_collision_free_name(const fs::path& dest_dir,
                                         const std::string& base_name,
                                         const std::string& ext) const;

    // Same walk as resolve_collision_free_name, but a taken candidate that is
    // unrecorded and already holds `digest` is handed back instead of skipped.
    // Paths in `reserved` (lexically normal strings) count as taken.
    Placement place(const fs::path& dest_dir, const std::string& base_name,
                    const std::string& ext, const ContentHash& digest,
                    const std::unordered_set<std::string>& reserved = {}) const;

    // Record a verified copy. Call only after the destination has been
    // written and re-hashed.
    void add(const ContentHash& digest, const fs::path& source_path,
             const fs::path& dest_path, uint64_t size);

    // Re-hash every file under root and replace the whole store with
    // (digest, unknown-origin, path, size) records. The old store is backed up.
    RebuildSummary rebuild(const fs::path& root, const Hasher& hasher,
                           StatusCallback cb = nullptr);

    size_t count() const { return index_->size(); }

private:
    static std::string key_for(const fs::path& path);
    static fs::path candidate_name(const fs::path& dest_dir, const std::string& base_name,
                                   const std::string& ext, int counter);

    std::unique_ptr<ContentIndex> index_;
};
