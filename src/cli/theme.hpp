#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Darkroom palette (ANSI escape sequences)
// Safelight: #C8553D
// Film:      #4A7C8C
namespace color {
    const std::string AMBER     = "\033[38;2;200;85;61m";
    const std::string TEAL      = "\033[38;2;74;124;140m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version, no screen clear (output is often piped to a log)
inline std::string banner() {
    return "\n" + color::AMBER + color::BOLD + "  shutterbox"
        + color::RESET + color::DIM + "  v" + APP_VERSION
        + color::RESET + "\n" + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Overwriting progress line; finish with progress_done()
inline std::string progress(size_t current, size_t total, const std::string& label) {
    return fmt::format("\r\033[K    {}[{}/{}]{} {}", color::DIM, current, total, color::RESET, label);
}

inline std::string progress_done() {
    return "\r\033[K";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<18}", key) + color::RESET + value + "\n";
}

} // namespace theme
