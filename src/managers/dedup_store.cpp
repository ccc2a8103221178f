#include "dedup_store.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

DedupStore::DedupStore(std::unique_ptr<ContentIndex> index)
    : index_(std::move(index)) {}

DedupStore DedupStore::open(const fs::path& db_path) {
    return DedupStore(std::make_unique<LogContentIndex>(db_path));
}

std::string DedupStore::key_for(const fs::path& path) {
    return path.lexically_normal().string();
}

bool DedupStore::exists(const ContentHash& digest) const {
    return index_->find(digest).has_value();
}

std::optional<fs::path> DedupStore::recorded_destination(const ContentHash& digest) const {
    auto record = index_->find(digest);
    if (!record) return std::nullopt;
    return fs::path(record->dest_path);
}

bool DedupStore::destination_exists(const fs::path& path) const {
    if (index_->has_destination(key_for(path))) return true;
    std::error_code ec;
    return fs::exists(path, ec);
}

fs::path DedupStore::candidate_name(const fs::path& dest_dir, const std::string& base_name,
                                   const std::string& ext, int counter) {
    if (counter == 1) return dest_dir / (base_name + ext);
    return dest_dir / fmt::format("{}_{}{}", base_name, counter, ext);
}

fs::path DedupStore::resolve_collision_free_name(const fs::path& dest_dir,
                                                 const std::string& base_name,
                                                 const std::string& ext) const {
    for (int counter = 1; counter <= MAX_COLLISION_SUFFIX; counter++) {
        fs::path candidate = candidate_name(dest_dir, base_name, ext, counter);
        if (!destination_exists(candidate)) return candidate;
    }

    throw PipelineError(ErrorKind::CollisionExhausted, fmt::format(
        "Too many filename collisions for {}{} in {}", base_name, ext, dest_dir.string()));
}

Placement DedupStore::place(const fs::path& dest_dir, const std::string& base_name,
                            const std::string& ext, const ContentHash& digest,
                            const std::unordered_set<std::string>& reserved) const {
    for (int counter = 1; counter <= MAX_COLLISION_SUFFIX; counter++) {
        fs::path candidate = candidate_name(dest_dir, base_name, ext, counter);
        std::string key = key_for(candidate);
        if (reserved.count(key) || index_->has_destination(key)) continue;

        std::error_code ec;
        if (!fs::exists(candidate, ec)) return Placement{candidate, false};

        // On disk but never recorded: reuse it if it is already our content
        try {
            if (Hasher::digest(candidate) == digest) return Placement{candidate, true};
        } catch (const PipelineError& e) {
            log_warn("cannot compare unrecorded {}: {}", candidate.string(), e.what());
        }
    }

    throw PipelineError(ErrorKind::CollisionExhausted, fmt::format(
        "Too many filename collisions for {}{} in {}", base_name, ext, dest_dir.string()));
}

void DedupStore::add(const ContentHash& digest, const fs::path& source_path,
                     const fs::path& dest_path, uint64_t size) {
    ContentRecord record;
    record.digest = digest;
    record.source_path = source_path.string();
    record.dest_path = key_for(dest_path);
    record.recorded_at = now_iso();
    record.size = size;
    index_->append(record);
    log_debug("recorded {} -> {}", digest, record.dest_path);
}

RebuildSummary DedupStore::rebuild(const fs::path& root, const Hasher& hasher,
                                   StatusCallback cb) {
    RebuildSummary summary;

    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(
             root, fs::directory_options::skip_permission_denied)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    summary.files_found = files.size();

    if (cb) cb(fmt::format("Hashing {} files under {}", files.size(), root.string()));
    auto hashes = hasher.digest_batch(files);

    std::vector<ContentRecord> records;
    records.reserve(files.size());
    std::unordered_map<std::string, std::string> seen;  // digest -> first path
    std::string ts = now_iso();

    for (const auto& file : files) {
        ContentHash digest;
        auto it = hashes.find(file.string());
        if (it != hashes.end()) {
            digest = it->second;
        } else {
            // Batch worker failed: one more try on this thread
            try {
                digest = Hasher::digest(file);
            } catch (const PipelineError& e) {
                log_error("rebuild: {}", e.what());
                summary.unreadable++;
                continue;
            }
        }

        auto first = seen.emplace(digest, file.string());
        if (!first.second) {
            log_warn("rebuild: {} has the same content as {}, not recorded",
                     file.string(), first.first->second);
            summary.duplicate_content++;
            continue;
        }

        std::error_code ec;
        ContentRecord r;
        r.digest = digest;
        r.source_path = UNKNOWN_ORIGIN;
        r.dest_path = key_for(file);
        r.recorded_at = ts;
        r.size = fs::file_size(file, ec);
        if (ec) r.size = 0;
        records.push_back(std::move(r));
    }

    index_->replace_all(records);
    summary.records = index_->size();
    log_info("rebuilt dedup store from {}: {} records", root.string(), summary.records);
    return summary;
}
