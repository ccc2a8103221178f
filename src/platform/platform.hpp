#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Number of hardware threads, at least 1.
unsigned cpu_count();

// True if the current user may create files in dir.
bool is_writable(const std::filesystem::path& dir);

// Free bytes available to an unprivileged user on the filesystem holding path.
// Returns 0 if the filesystem cannot be queried.
uint64_t available_bytes(const std::filesystem::path& path);

// True if `program` resolves to an executable (absolute path or via PATH).
bool program_available(const std::string& program);

} // namespace platform
