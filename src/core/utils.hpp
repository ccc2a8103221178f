#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstdint>
#include <filesystem>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact local timestamp for file names: YYYYMMDD-HHMMSS.
std::string now_compact();

// Format a calendar date as a bucket path "YYYY/MM/DD".
// utc=true formats in UTC, otherwise local time.
std::string date_path_from_time(std::time_t t, bool utc = false);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// "ARW", ".ARW", " arw" -> ".arw". Empty input stays empty.
std::string normalize_extension(const std::string& ext);

// Lower-cased extension of a path including the dot, "" if none.
std::string extension_of(const std::filesystem::path& path);

// Split a comma-separated extension list into normalized entries.
std::vector<std::string> parse_extension_list(const std::string& csv);

std::string join_csv(const std::vector<std::string>& items);

// 1536 -> "1.5 KB". One truncated decimal, binary units.
std::string human_size(uint64_t bytes);

// First 8 characters followed by "...", "" for an empty secret.
std::string mask_secret(const std::string& secret);

// Parse a menu selection over items numbered 1..count: "1,3-5" or "all".
// Returns zero-based indices in the order given, without repeats.
Result<std::vector<size_t>> parse_selection(const std::string& text, size_t count);
