#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warn, Error };

// Route log lines to `path` (appended). DEBUG lines are dropped unless verbose.
// Until log_init is called every log call is a no-op.
void log_init(const std::filesystem::path& path, bool verbose);

// Current log file, empty if logging is not initialised.
std::filesystem::path log_path();

bool log_verbose();

void app_log(LogLevel level, const std::string& msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    if (!log_verbose()) return;
    app_log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    app_log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    app_log(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    app_log(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}
