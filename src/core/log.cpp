#include "log.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::mutex g_log_mutex;
fs::path g_log_path;
bool g_verbose = false;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO ";
}

} // namespace

void log_init(const fs::path& path, bool verbose) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
    g_verbose = verbose;
    if (!path.empty()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }
}

fs::path log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_path;
}

bool log_verbose() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_verbose;
}

void app_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) return;
    if (level == LogLevel::Debug && !g_verbose) return;

    std::ofstream out(g_log_path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << ts << " [" << level_tag(level) << "] " << msg << "\n";
}
