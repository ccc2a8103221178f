#include "mirror.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

// ── RsyncTransport ───────────────────────────────────────────

RsyncTransport::RsyncTransport(std::string program) : program_(std::move(program)) {}

int RsyncTransport::transfer(const fs::path& src, const fs::path& dst, bool dry_run) {
    std::vector<std::string> args = {"-av", "--ignore-existing"};
    if (dry_run) args.push_back("--dry-run");
    // Trailing slash: copy the contents of src, not src itself
    args.push_back(src.string() + "/");
    args.push_back(dst.string() + "/");

    log_debug("running {} -av --ignore-existing {} {}", program_, src.string(), dst.string());
    return platform::run(program_, args);
}

// ── FilesystemTransport ─────────────────────────────────────

int FilesystemTransport::transfer(const fs::path& src, const fs::path& dst, bool dry_run) {
    stats_ = Stats{};

    std::error_code ec;
    auto it = fs::recursive_directory_iterator(
        src, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        fs::path target = dst / it->path().lexically_relative(src);
        if (fs::exists(target, entry_ec)) {
            stats_.existing++;
            continue;
        }
        if (dry_run) {
            log_info("[dry-run] would mirror {}", target.string());
            stats_.copied++;
            continue;
        }

        fs::create_directories(target.parent_path(), entry_ec);
        if (!entry_ec) {
            fs::copy_file(it->path(), target, fs::copy_options::skip_existing, entry_ec);
        }
        if (entry_ec) {
            log_error("mirror: {} -> {}: {}", it->path().string(), target.string(),
                      entry_ec.message());
            stats_.failed++;
            continue;
        }

        auto mtime = fs::last_write_time(it->path(), entry_ec);
        if (!entry_ec) fs::last_write_time(target, mtime, entry_ec);
        stats_.copied++;
    }

    if (ec) {
        log_error("mirror: walking {} failed: {}", src.string(), ec.message());
        return 1;
    }
    log_info("mirror: {} copied, {} already present, {} failed",
             stats_.copied, stats_.existing, stats_.failed);
    return stats_.failed == 0 ? 0 : 1;
}

std::unique_ptr<MirrorTransport> make_mirror_transport(const MirrorConfig& config) {
    if (config.tool == "rsync") return std::make_unique<RsyncTransport>();
    if (config.tool == "builtin") return std::make_unique<FilesystemTransport>();
    throw PipelineError(ErrorKind::Config, "Unknown mirror tool: " + config.tool);
}

// ── MirrorPropagator ─────────────────────────────────────────

MirrorPropagator::MirrorPropagator(MirrorTransport& transport) : transport_(transport) {}

int MirrorPropagator::propagate(const fs::path& primary_root, const fs::path& mirror_root,
                                bool dry_run, StatusCallback cb) {
    std::error_code ec;
    if (!fs::is_directory(primary_root, ec)) {
        throw PipelineError(ErrorKind::IO,
            "No archive directory on primary (" + primary_root.string() + ")");
    }
    if (fs::exists(mirror_root, ec) && fs::equivalent(primary_root, mirror_root, ec)) {
        throw PipelineError(ErrorKind::Config, "Primary and mirror are the same directory");
    }

    if (!dry_run) {
        fs::create_directories(mirror_root, ec);
        if (ec) {
            throw PipelineError(ErrorKind::IO, fmt::format(
                "Cannot create {}: {}", mirror_root.string(), ec.message()));
        }
    }

    if (cb) cb(fmt::format("Mirroring {} -> {}", primary_root.string(), mirror_root.string()));
    int status = transport_.transfer(primary_root, mirror_root, dry_run);
    if (status == 0) {
        log_info("mirror complete: {} -> {}", primary_root.string(), mirror_root.string());
    } else {
        log_error("mirror transfer exited with code {}", status);
    }
    return status;
}
