#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

struct tm local_tm(std::time_t t) {
    struct tm tm_buf = {};
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

std::string format_now(const char* pattern) {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf = local_tm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

} // namespace

std::string now_iso() {
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_compact() {
    return format_now("%Y%m%d-%H%M%S");
}

std::string date_path_from_time(std::time_t t, bool utc) {
    struct tm tm_buf = {};
    if (utc) {
        gmtime_r(&t, &tm_buf);
    } else {
        tm_buf = local_tm(t);
    }
    return fmt::format("{:04d}/{:02d}/{:02d}",
                       tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_extension(const std::string& ext) {
    std::string e = ext;
    trim(e);
    if (e.empty()) return e;
    if (e[0] != '.') e.insert(e.begin(), '.');
    return to_lower(e);
}

std::string extension_of(const std::filesystem::path& path) {
    return to_lower(path.extension().string());
}

std::vector<std::string> parse_extension_list(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto ext = normalize_extension(item);
        if (!ext.empty() && std::find(out.begin(), out.end(), ext) == out.end()) {
            out.push_back(ext);
        }
    }
    return out;
}

std::string join_csv(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

std::string human_size(uint64_t bytes) {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    if (bytes >= GB) return fmt::format("{}.{} GB", bytes / GB, (bytes % GB) * 10 / GB);
    if (bytes >= MB) return fmt::format("{}.{} MB", bytes / MB, (bytes % MB) * 10 / MB);
    if (bytes >= KB) return fmt::format("{}.{} KB", bytes / KB, (bytes % KB) * 10 / KB);
    return fmt::format("{} B", bytes);
}

std::string mask_secret(const std::string& secret) {
    if (secret.empty()) return "";
    return secret.substr(0, 8) + "...";
}

Result<std::vector<size_t>> parse_selection(const std::string& text, size_t count) {
    using R = Result<std::vector<size_t>>;
    std::string input = text;
    trim(input);
    if (input.empty()) return R::Ok({});

    std::vector<size_t> picked;
    auto add = [&](int n) {
        size_t idx = static_cast<size_t>(n - 1);
        if (std::find(picked.begin(), picked.end(), idx) == picked.end()) picked.push_back(idx);
    };

    if (to_lower(input) == "all") {
        for (size_t i = 1; i <= count; i++) add(static_cast<int>(i));
        return R::Ok(picked);
    }

    std::stringstream ss(input);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (item.empty()) continue;

        int lo = 0, hi = 0;
        auto dash = item.find('-');
        if (dash == std::string::npos) {
            lo = hi = safe_stoi(item, 0);
        } else {
            std::string a = item.substr(0, dash);
            std::string b = item.substr(dash + 1);
            trim(a);
            trim(b);
            lo = safe_stoi(a, 0);
            hi = safe_stoi(b, 0);
        }
        if (lo < 1 || hi < lo || static_cast<size_t>(hi) > count) {
            return R::Err(fmt::format("invalid selection '{}' (choose 1-{})", item, count));
        }
        for (int n = lo; n <= hi; n++) add(n);
    }
    return R::Ok(picked);
}
