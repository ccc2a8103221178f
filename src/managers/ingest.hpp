#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <iterator>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

// Case-insensitive extension filter. Include (if non-empty) is checked
// first, then exclude (if non-empty); exclude wins.
struct ExtensionFilter {
    std::vector<std::string> include;   // ".ext", lower case
    std::vector<std::string> exclude;

    bool matches(const fs::path& path) const;
};

// Lazy walk of the regular files under a root that pass a filter.
// Each begin() starts a fresh traversal, so a scan can be iterated again.
class FileScan {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = fs::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const fs::path*;
        using reference = const fs::path&;

        iterator() = default;
        iterator(const fs::path& root, const ExtensionFilter* filter);

        reference operator*() const { return it_->path(); }
        pointer operator->() const { return &it_->path(); }
        iterator& operator++();

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        void advance_to_match();
        void step();

        fs::recursive_directory_iterator it_;
        const ExtensionFilter* filter_ = nullptr;
    };

    FileScan(fs::path root, ExtensionFilter filter);

    iterator begin() const { return iterator(root_, &filter_); }
    iterator end() const { return iterator(); }

    // All matches, sorted, for deterministic processing order.
    std::vector<fs::path> collect() const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    ExtensionFilter filter_;
};

FileScan scan(const fs::path& root,
              const std::vector<std::string>& include_exts,
              const std::vector<std::string>& exclude_exts);

// Dates reported by a metadata source, already formatted "YYYY/MM/DD".
// Absent, "-" or zeroed values are allowed; the bucketer skips them.
struct CaptureTimes {
    std::optional<std::string> original;    // DateTimeOriginal
    std::optional<std::string> created;     // CreateDate
    std::optional<std::string> modified;    // FileModifyDate
};

class MetadataExtractor {
public:
    virtual ~MetadataExtractor() = default;
    virtual CaptureTimes read(const fs::path& path) const = 0;
};

// Reads the three dates with a single exiftool invocation.
class ExiftoolExtractor : public MetadataExtractor {
public:
    explicit ExiftoolExtractor(std::string program = "exiftool");
    CaptureTimes read(const fs::path& path) const override;

private:
    std::string program_;
};

// True for a well-formed, non-zeroed "YYYY/MM/DD".
bool is_valid_bucket_key(const std::string& key);

// Derives the YYYY/MM/DD bucket for a file:
// capture time -> creation time -> metadata modify time
// -> filesystem mtime (local) -> today (UTC).
class DateBucketer {
public:
    using Clock = std::function<std::time_t()>;

    // extractor may be null (filesystem and clock fallbacks only).
    explicit DateBucketer(const MetadataExtractor* extractor, Clock clock = nullptr);

    std::string bucket_key_for(const fs::path& path) const;

private:
    const MetadataExtractor* extractor_;
    Clock clock_;
};
