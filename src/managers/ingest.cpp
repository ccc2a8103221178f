#include "ingest.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <sys/stat.h>

// ── ExtensionFilter ─────────────────────────────────────────

bool ExtensionFilter::matches(const fs::path& path) const {
    std::string ext = extension_of(path);
    if (!include.empty() &&
        std::find(include.begin(), include.end(), ext) == include.end()) {
        return false;
    }
    if (!exclude.empty() &&
        std::find(exclude.begin(), exclude.end(), ext) != exclude.end()) {
        return false;
    }
    return true;
}

// ── FileScan ────────────────────────────────────────────────

FileScan::iterator::iterator(const fs::path& root, const ExtensionFilter* filter)
    : filter_(filter) {
    std::error_code ec;
    it_ = fs::recursive_directory_iterator(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_warn("scan: cannot open {}: {}", root.string(), ec.message());
        it_ = fs::recursive_directory_iterator();
        return;
    }
    advance_to_match();
}

void FileScan::iterator::step() {
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
        log_warn("scan: traversal stopped: {}", ec.message());
        it_ = fs::recursive_directory_iterator();
    }
}

void FileScan::iterator::advance_to_match() {
    while (it_ != fs::recursive_directory_iterator()) {
        std::error_code ec;
        if (it_->is_regular_file(ec) && filter_->matches(it_->path())) return;
        step();
    }
}

FileScan::iterator& FileScan::iterator::operator++() {
    step();
    advance_to_match();
    return *this;
}

FileScan::FileScan(fs::path root, ExtensionFilter filter)
    : root_(std::move(root)), filter_(std::move(filter)) {}

std::vector<fs::path> FileScan::collect() const {
    std::vector<fs::path> files(begin(), end());
    std::sort(files.begin(), files.end());
    return files;
}

FileScan scan(const fs::path& root,
              const std::vector<std::string>& include_exts,
              const std::vector<std::string>& exclude_exts) {
    ExtensionFilter filter;
    for (const auto& e : include_exts) filter.include.push_back(normalize_extension(e));
    for (const auto& e : exclude_exts) filter.exclude.push_back(normalize_extension(e));
    return FileScan(root, std::move(filter));
}

// ── Metadata ────────────────────────────────────────────────

ExiftoolExtractor::ExiftoolExtractor(std::string program)
    : program_(std::move(program)) {}

CaptureTimes ExiftoolExtractor::read(const fs::path& path) const {
    // -f prints "-" for a missing tag, so output is always three lines in order
    auto result = platform::capture(program_, {
        "-DateTimeOriginal", "-CreateDate", "-FileModifyDate",
        "-d", "%Y/%m/%d", "-s3", "-f", path.string()
    });

    CaptureTimes times;
    if (result.failed()) {
        log_debug("{} exited {} for {}", program_, result.exit_code, path.string());
        return times;
    }

    std::istringstream lines(result.stdout_data);
    std::string line;
    std::vector<std::string> values;
    while (std::getline(lines, line)) {
        trim(line);
        values.push_back(line);
    }
    if (values.size() > 0) times.original = values[0];
    if (values.size() > 1) times.created = values[1];
    if (values.size() > 2) times.modified = values[2];
    return times;
}

// ── Bucketing ───────────────────────────────────────────────

bool is_valid_bucket_key(const std::string& key) {
    if (key.size() != 10 || key[4] != '/' || key[7] != '/') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(key[i]))) return false;
    }
    // Cameras without a set clock write 0000:00:00
    if (key.find("0000") != std::string::npos) return false;

    int month = safe_stoi(key.substr(5, 2));
    int day = safe_stoi(key.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

DateBucketer::DateBucketer(const MetadataExtractor* extractor, Clock clock)
    : extractor_(extractor), clock_(std::move(clock)) {}

std::string DateBucketer::bucket_key_for(const fs::path& path) const {
    if (extractor_) {
        CaptureTimes times = extractor_->read(path);
        for (const auto* candidate : {&times.original, &times.created, &times.modified}) {
            if (*candidate && is_valid_bucket_key(**candidate)) return **candidate;
        }
    }

    struct stat st;
    if (::stat(path.c_str(), &st) == 0) {
        std::string key = date_path_from_time(st.st_mtime);
        if (is_valid_bucket_key(key)) return key;
    }

    std::time_t now = clock_ ? clock_() : std::time(nullptr);
    log_debug("no usable date for {}, using today", path.string());
    return date_path_from_time(now, true);
}
