#include "copy_engine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <system_error>

CopyEngine::CopyEngine(DedupStore& store, const DateBucketer& bucketer,
                       const fs::path& archive_root, bool dry_run)
    : store_(store), bucketer_(bucketer), archive_root_(archive_root), dry_run_(dry_run) {}

void CopyEngine::copy_preserving(const fs::path& source, const fs::path& dest) {
    std::error_code ec;
    if (!fs::copy_file(source, dest, fs::copy_options::none, ec) || ec) {
        // A partial file is ours to clean up; an existing one never is.
        if (ec != std::errc::file_exists) {
            std::error_code rm_ec;
            fs::remove(dest, rm_ec);
        }
        throw PipelineError(ErrorKind::Copy, fmt::format(
            "Failed to copy {} -> {}: {}", source.string(), dest.string(), ec.message()));
    }

    auto perms = fs::status(source, ec).permissions();
    if (!ec) fs::permissions(dest, perms, ec);
    if (ec) log_warn("could not preserve permissions on {}: {}", dest.string(), ec.message());

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) fs::last_write_time(dest, mtime, ec);
    if (ec) log_warn("could not preserve mtime on {}: {}", dest.string(), ec.message());
}

void CopyEngine::verify_copy(const fs::path& dest, const ContentHash& expected) {
    ContentHash actual;
    try {
        actual = Hasher::digest(dest);
    } catch (const PipelineError&) {
        std::error_code ec;
        fs::remove(dest, ec);
        throw;
    }
    if (actual != expected) {
        std::error_code ec;
        fs::remove(dest, ec);
        throw PipelineError(ErrorKind::Integrity, fmt::format(
            "Hash mismatch after copy to {} (expected {}, got {})",
            dest.string(), expected, actual));
    }
}

CopyOutcome CopyEngine::process_file(const fs::path& source,
                                     const std::unordered_map<std::string, ContentHash>& precomputed) {
    CopyOutcome out;
    out.source = source;

    try {
        auto it = precomputed.find(source.string());
        out.digest = (it != precomputed.end()) ? it->second : Hasher::digest(source);

        std::error_code ec;
        out.size = fs::file_size(source, ec);
        if (ec) {
            throw PipelineError(ErrorKind::IO, fmt::format(
                "Cannot stat {}: {}", source.string(), ec.message()));
        }

        if (store_.exists(out.digest) || planned_digests_.count(out.digest)) {
            out.status = CopyStatus::SkippedDuplicate;
            if (auto prev = store_.recorded_destination(out.digest)) out.destination = *prev;
            log_debug("skip {} (already archived)", source.string());
            return out;
        }

        fs::path dest_dir = archive_root_ / bucketer_.bucket_key_for(source);
        std::string stem = source.stem().string();
        std::string ext = source.extension().string();
        Placement placement = store_.place(dest_dir, stem, ext, out.digest, planned_destinations_);
        out.destination = placement.path;

        if (dry_run_) {
            out.status = placement.unrecorded_copy ? CopyStatus::Recovered : CopyStatus::WouldCopy;
            planned_digests_.insert(out.digest);
            planned_destinations_.insert(out.destination.lexically_normal().string());
            return out;
        }

        if (placement.unrecorded_copy) {
            store_.add(out.digest, source, out.destination, out.size);
            out.status = CopyStatus::Recovered;
            log_info("recorded existing copy {} for {}", out.destination.string(), source.string());
            return out;
        }

        fs::create_directories(dest_dir, ec);
        if (ec) {
            throw PipelineError(ErrorKind::IO, fmt::format(
                "Cannot create {}: {}", dest_dir.string(), ec.message()));
        }

        copy_preserving(source, out.destination);
        verify_copy(out.destination, out.digest);
        store_.add(out.digest, source, out.destination, out.size);

        out.status = CopyStatus::Copied;
        log_debug("copied {} -> {}", source.string(), out.destination.string());
    } catch (const PipelineError& e) {
        out.status = CopyStatus::Error;
        out.error_kind = e.kind();
        out.error = e.what();
        log_error("{}: {}", error_kind_name(e.kind()), e.what());
    } catch (const fs::filesystem_error& e) {
        out.status = CopyStatus::Error;
        out.error_kind = ErrorKind::IO;
        out.error = e.what();
        log_error("IOError: {}", e.what());
    }
    return out;
}

CopySummary CopyEngine::run(const std::vector<fs::path>& files,
                            const std::unordered_map<std::string, ContentHash>& precomputed,
                            CopyProgress progress) {
    CopySummary summary;
    planned_digests_.clear();
    planned_destinations_.clear();
    for (size_t i = 0; i < files.size(); i++) {
        CopyOutcome out = process_file(files[i], precomputed);
        switch (out.status) {
            case CopyStatus::Copied:
                summary.copied++;
                summary.copied_bytes += out.size;
                break;
            case CopyStatus::WouldCopy:
                summary.would_copy++;
                summary.would_copy_bytes += out.size;
                break;
            case CopyStatus::SkippedDuplicate:
                summary.skipped++;
                break;
            case CopyStatus::Recovered:
                summary.recovered++;
                break;
            case CopyStatus::Error:
                summary.errors++;
                break;
        }
        if (progress) progress(i + 1, files.size(), out);
        if (out.status == CopyStatus::Error) summary.failures.push_back(std::move(out));
    }

    log_info("copy batch: {} copied, {} would copy, {} skipped, {} recovered, {} errors",
             summary.copied, summary.would_copy, summary.skipped, summary.recovered, summary.errors);
    return summary;
}
