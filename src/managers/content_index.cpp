#include "content_index.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

bool is_hex_digest(const std::string& s) {
    if (s.size() != static_cast<size_t>(DIGEST_HEX_LEN)) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (;;) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

bool has_delimiter(const std::string& s) {
    return s.find('\t') != std::string::npos || s.find('\n') != std::string::npos;
}

// A crash mid-append can leave a torn last line without its newline.
bool ends_without_newline(const fs::path& p) {
    std::ifstream in(p, std::ios::binary | std::ios::ate);
    if (!in || in.tellg() <= 0) return false;
    in.seekg(-1, std::ios::end);
    char c = '\n';
    in.get(c);
    return c != '\n';
}

} // namespace

// ── MemoryContentIndex ───────────────────────────────────────

std::optional<ContentRecord> MemoryContentIndex::find(const std::string& digest) const {
    auto it = by_digest_.find(digest);
    if (it == by_digest_.end()) return std::nullopt;
    return it->second;
}

bool MemoryContentIndex::has_destination(const std::string& dest_path) const {
    return destinations_.count(dest_path) > 0;
}

bool MemoryContentIndex::insert(const ContentRecord& record) {
    if (by_digest_.count(record.digest) || destinations_.count(record.dest_path)) {
        return false;
    }
    by_digest_.emplace(record.digest, record);
    destinations_.insert(record.dest_path);
    return true;
}

void MemoryContentIndex::clear() {
    by_digest_.clear();
    destinations_.clear();
}

void MemoryContentIndex::append(const ContentRecord& record) {
    if (!insert(record)) {
        throw PipelineError(ErrorKind::StateCorruption, fmt::format(
            "Refusing duplicate record for {} -> {}", record.digest, record.dest_path));
    }
}

void MemoryContentIndex::replace_all(const std::vector<ContentRecord>& records) {
    clear();
    for (const auto& r : records) {
        if (!insert(r)) {
            log_warn("replace_all: dropping conflicting record {} -> {}", r.digest, r.dest_path);
        }
    }
}

// ── LogContentIndex ──────────────────────────────────────────

LogContentIndex::LogContentIndex(const fs::path& log_path) : log_path_(log_path) {
    load();
}

std::string LogContentIndex::format_line(const ContentRecord& r) {
    return fmt::format("{}\t{}\t{}\t{}\t{}\n",
                       r.digest, r.source_path, r.dest_path, r.recorded_at, r.size);
}

std::optional<ContentRecord> LogContentIndex::parse_line(const std::string& line,
                                                        std::string& reason) {
    auto fields = split_tabs(line);
    if (fields.size() != 5) {
        reason = fmt::format("expected 5 fields, found {}", fields.size());
        return std::nullopt;
    }
    if (!is_hex_digest(fields[0])) {
        reason = "digest is not a 64-character hex string";
        return std::nullopt;
    }
    if (fields[2].empty()) {
        reason = "empty destination path";
        return std::nullopt;
    }

    ContentRecord r;
    r.digest = fields[0];
    r.source_path = fields[1];
    r.dest_path = fields[2];
    r.recorded_at = fields[3];
    try {
        size_t used = 0;
        r.size = std::stoull(fields[4], &used);
        if (used != fields[4].size()) throw std::invalid_argument("trailing data");
    } catch (const std::exception&) {
        reason = "size is not a number";
        return std::nullopt;
    }
    return r;
}

void LogContentIndex::load() {
    clear();
    corrupt_.clear();

    std::ifstream in(log_path_);
    if (!in) return;  // no log yet: empty store

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;

        std::string reason;
        auto record = parse_line(line, reason);
        if (!record) {
            // Malformed records count as absent
            corrupt_.push_back({line_no, reason});
            log_warn("{}:{}: skipping record ({})", log_path_.string(), line_no, reason);
            continue;
        }
        if (!insert(*record)) {
            corrupt_.push_back({line_no, "duplicate digest or destination"});
            log_warn("{}:{}: skipping duplicate record", log_path_.string(), line_no);
        }
    }
}

void LogContentIndex::append(const ContentRecord& record) {
    if (has_delimiter(record.source_path) || has_delimiter(record.dest_path)) {
        throw PipelineError(ErrorKind::IO,
            "Path contains a tab or newline and cannot be recorded: " + record.dest_path);
    }
    if (find(record.digest) || has_destination(record.dest_path)) {
        throw PipelineError(ErrorKind::StateCorruption, fmt::format(
            "Refusing duplicate record for {} -> {}", record.digest, record.dest_path));
    }

    fs::create_directories(log_path_.parent_path());
    bool torn_tail = ends_without_newline(log_path_);
    std::ofstream out(log_path_, std::ios::app);
    if (!out) {
        throw PipelineError(ErrorKind::IO, "Cannot open " + log_path_.string() + " for append");
    }
    if (torn_tail) out << '\n';
    out << format_line(record);
    out.flush();
    if (!out) {
        throw PipelineError(ErrorKind::IO, "Failed to append to " + log_path_.string());
    }

    insert(record);
}

void LogContentIndex::replace_all(const std::vector<ContentRecord>& records) {
    fs::create_directories(log_path_.parent_path());

    std::error_code ec;
    if (fs::exists(log_path_) && fs::file_size(log_path_, ec) > 0) {
        fs::copy_file(log_path_, fs::path(log_path_.string() + ".bak"),
                      fs::copy_options::overwrite_existing);
    }

    fs::path tmp = log_path_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw PipelineError(ErrorKind::IO, "Cannot write " + tmp.string());
        }
        for (const auto& r : records) {
            if (has_delimiter(r.source_path) || has_delimiter(r.dest_path)) {
                log_warn("rebuild: skipping unrecordable path {}", r.dest_path);
                continue;
            }
            out << format_line(r);
        }
        out.flush();
        if (!out) {
            throw PipelineError(ErrorKind::IO, "Failed writing " + tmp.string());
        }
    }
    fs::rename(tmp, log_path_);

    load();
}

std::vector<CorruptEntry> LogContentIndex::validate(const fs::path& log_path) {
    std::vector<CorruptEntry> problems;
    std::ifstream in(log_path);
    if (!in) return problems;

    std::unordered_map<std::string, size_t> digests;
    std::unordered_map<std::string, size_t> dests;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;

        std::string reason;
        auto record = parse_line(line, reason);
        if (!record) {
            problems.push_back({line_no, reason});
            continue;
        }
        auto d = digests.emplace(record->digest, line_no);
        if (!d.second) {
            problems.push_back({line_no, fmt::format("digest already recorded on line {}", d.first->second)});
        }
        auto p = dests.emplace(record->dest_path, line_no);
        if (!p.second) {
            problems.push_back({line_no, fmt::format("destination already recorded on line {}", p.first->second)});
        }
    }
    return problems;
}
