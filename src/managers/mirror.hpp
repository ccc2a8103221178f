#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Copies the contents of src into dst, additively: files already present in
// dst are left untouched and nothing is ever deleted. Returns the tool's
// exit status (0 = success).
class MirrorTransport {
public:
    virtual ~MirrorTransport() = default;
    virtual int transfer(const fs::path& src, const fs::path& dst, bool dry_run) = 0;
};

// rsync -av --ignore-existing
class RsyncTransport : public MirrorTransport {
public:
    explicit RsyncTransport(std::string program = "rsync");
    int transfer(const fs::path& src, const fs::path& dst, bool dry_run) override;

private:
    std::string program_;
};

// In-process copy for machines without rsync.
class FilesystemTransport : public MirrorTransport {
public:
    struct Stats {
        size_t copied = 0;
        size_t existing = 0;
        size_t failed = 0;
    };

    int transfer(const fs::path& src, const fs::path& dst, bool dry_run) override;

    const Stats& last_stats() const { return stats_; }

private:
    Stats stats_;
};

// "rsync" or "builtin". Throws PipelineError(Config) for anything else.
std::unique_ptr<MirrorTransport> make_mirror_transport(const MirrorConfig& config);

// One-way replication of the primary archive to a mirror archive.
class MirrorPropagator {
public:
    explicit MirrorPropagator(MirrorTransport& transport);

    // Returns the transport's status. Throws PipelineError when the roots
    // are unusable (primary missing, same directory, mirror not creatable).
    int propagate(const fs::path& primary_root, const fs::path& mirror_root,
                  bool dry_run, StatusCallback cb = nullptr);

private:
    MirrorTransport& transport_;
};
