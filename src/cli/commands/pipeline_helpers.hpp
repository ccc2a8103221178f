#pragma once

#include "../base_cli.hpp"
#include <string>
#include <filesystem>

// Shared helpers used by the pipeline command files (ingest.cpp, upload.cpp, sync.cpp)

// Archive root for the given volume override (or the configured archive),
// after checking the volume is mounted. Empty path if the check failed
// (the reason has already been printed).
std::filesystem::path require_archive_root(const Config& config, const std::string& volume);

// Mirror the archive of `from` onto `to`. Returns the transfer status.
int mirror_archives(const Config& config, const std::string& from,
                    const std::string& to, bool dry_run);

// Forward declarations for command registration
void register_ingest_commands(BaseCLI& cli);
void register_upload_commands(BaseCLI& cli);
void register_status_commands(BaseCLI& cli);
void register_sync_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);
