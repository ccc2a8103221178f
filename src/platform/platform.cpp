#include "platform.hpp"
#include <cstdlib>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

unsigned cpu_count() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

bool is_writable(const fs::path& dir) {
    return access(dir.c_str(), W_OK) == 0;
}

uint64_t available_bytes(const fs::path& path) {
    struct statvfs st;
    if (statvfs(path.c_str(), &st) != 0) return 0;
    return static_cast<uint64_t>(st.f_bavail) * static_cast<uint64_t>(st.f_frsize);
}

bool program_available(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace platform
