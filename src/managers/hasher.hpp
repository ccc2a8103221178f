#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <filesystem>

namespace fs = std::filesystem;

// Lower-case hex SHA-256 of a file's bytes.
using ContentHash = std::string;

// Called from worker threads after each file: (done, total).
using HashProgress = std::function<void(size_t, size_t)>;

class Hasher {
public:
    // workers = 0 picks the detected CPU count.
    explicit Hasher(unsigned workers = 0);

    // SHA-256 of the file. Throws PipelineError(IO) if it cannot be read.
    static ContentHash digest(const fs::path& path);

    // Hash many files on a bounded worker pool. Files that fail to hash are
    // absent from the result; callers fall back to digest() for those.
    // Keys are path.string() as given.
    std::unordered_map<std::string, ContentHash>
    digest_batch(const std::vector<fs::path>& paths, HashProgress progress = nullptr) const;

    unsigned workers() const { return workers_; }

private:
    unsigned workers_;
};
