#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <core/errors.hpp>
#include "dedup_store.hpp"
#include "ingest.hpp"

namespace fs = std::filesystem;

enum class CopyStatus {
    Copied,
    WouldCopy,          // dry run: destination decided, nothing written
    SkippedDuplicate,
    Recovered,          // verified copy from an interrupted run, recorded in place
    Error,
};

struct CopyOutcome {
    fs::path source;
    CopyStatus status = CopyStatus::Error;
    fs::path destination;           // empty for duplicates that were never placed
    ContentHash digest;
    uint64_t size = 0;
    ErrorKind error_kind = ErrorKind::IO;
    std::string error;
};

struct CopySummary {
    size_t copied = 0;
    size_t would_copy = 0;
    size_t skipped = 0;
    size_t recovered = 0;
    size_t errors = 0;
    uint64_t copied_bytes = 0;
    uint64_t would_copy_bytes = 0;
    std::vector<CopyOutcome> failures;
};

// (index, total, outcome) after each file of a batch.
using CopyProgress = std::function<void(size_t, size_t, const CopyOutcome&)>;

// Places new content into <archive_root>/<YYYY/MM/DD>/ and records it.
// Per file: digest -> dedup check -> destination -> copy -> re-hash -> record.
class CopyEngine {
public:
    CopyEngine(DedupStore& store, const DateBucketer& bucketer,
               const fs::path& archive_root, bool dry_run);

    // Never throws for per-file failures; they come back as CopyStatus::Error.
    // precomputed is keyed by path.string() as produced by Hasher::digest_batch.
    // In a dry run, content and names planned by earlier calls count as taken
    // until the next run().
    CopyOutcome process_file(const fs::path& source,
                             const std::unordered_map<std::string, ContentHash>& precomputed);

    // Process files in order. Failures are counted, never abort the batch.
    // Dry-run plans start empty for every batch.
    CopySummary run(const std::vector<fs::path>& files,
                    const std::unordered_map<std::string, ContentHash>& precomputed,
                    CopyProgress progress = nullptr);

    bool dry_run() const { return dry_run_; }

private:
    // copy_file + permissions + mtime. Throws PipelineError(Copy).
    static void copy_preserving(const fs::path& source, const fs::path& dest);

    // Re-hash dest; on mismatch remove it and throw PipelineError(Integrity).
    static void verify_copy(const fs::path& dest, const ContentHash& expected);

    DedupStore& store_;
    const DateBucketer& bucketer_;
    fs::path archive_root_;
    bool dry_run_;

    // Dry run only: what earlier files of the batch would have added
    std::unordered_set<std::string> planned_digests_;
    std::unordered_set<std::string> planned_destinations_;
};
