#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Immutable, fully-resolved configuration. Components receive the pieces they
// need at construction and never read the environment themselves.
class Config {
public:
    // Load <home>/config.yaml
    static Result<Config> load(const fs::path& home);

    // Parse configuration from YAML text (home is used for store paths).
    static Result<Config> parse(const std::string& yaml_text, const fs::path& home);

    // Accessors
    const ServerConfig& server() const { return server_; }
    const VolumeConfig& volumes() const { return volumes_; }
    const IngestConfig& ingest() const { return ingest_; }
    const UploadConfig& upload() const { return upload_; }
    const MirrorConfig& mirror() const { return mirror_; }
    const fs::path& home() const { return home_; }

    // Store locations under home
    fs::path hash_db_path() const;
    fs::path upload_state_path() const;
    fs::path log_dir() const;

    // Volume layout under mount_root
    fs::path volume_path(const std::string& volume) const;
    fs::path source_root(const std::string& volume) const;
    fs::path archive_root(const std::string& volume) const;

    // Copy with the given volume names replacing the configured ones
    // (empty strings keep the configured value).
    Config with_volumes(const std::string& source,
                        const std::string& archive,
                        const std::string& mirror) const;

    // Problems that make upload impossible (missing server url / key).
    std::vector<std::string> validate_upload() const;

    Config() = default;

private:
    ServerConfig server_;
    VolumeConfig volumes_;
    IngestConfig ingest_;
    UploadConfig upload_;
    MirrorConfig mirror_;
    fs::path home_;
};

// Default config home: ~/.shutterbox
fs::path default_config_home();

fs::path get_config_path(const fs::path& home);
bool config_exists(const fs::path& home);

// Write the commented default config unless one already exists.
Result<void> create_default_config(const fs::path& home);
