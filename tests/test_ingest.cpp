#include <gtest/gtest.h>
#include <managers/ingest.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <utime.h>

namespace fs = std::filesystem;

// Returns whatever dates the test sets; counts calls.
class FakeExtractor : public MetadataExtractor {
public:
    CaptureTimes times;
    mutable int calls = 0;

    CaptureTimes read(const fs::path&) const override {
        calls++;
        return times;
    }
};

class IngestTest : public ::testing::Test {
protected:
    fs::path card;

    void SetUp() override {
        card = fs::temp_directory_path() /
               (std::string("shutterbox_ingest_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(card);
        fs::create_directories(card);
    }

    void TearDown() override {
        fs::remove_all(card);
    }

    fs::path write_file(const std::string& rel, const std::string& content = "x") {
        auto full = card / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
        return full;
    }

    static std::vector<std::string> names(const std::vector<fs::path>& paths) {
        std::vector<std::string> out;
        for (const auto& p : paths) out.push_back(p.filename().string());
        std::sort(out.begin(), out.end());
        return out;
    }
};

TEST_F(IngestTest, IncludeIsCaseInsensitive) {
    write_file("100MSDCF/DSC001.ARW");
    write_file("100MSDCF/DSC002.arw");
    write_file("100MSDCF/DSC002.JPG");

    auto files = scan(card, {".arw"}, {}).collect();
    EXPECT_EQ(names(files), (std::vector<std::string>{"DSC001.ARW", "DSC002.arw"}));
}

TEST_F(IngestTest, ExcludeWinsRegardlessOfCase) {
    write_file("DSC001.ARW");
    write_file("DSC002.arw");
    write_file("DSC003.jpg");

    auto both = scan(card, {".arw", ".jpg"}, {".arw"}).collect();
    EXPECT_EQ(names(both), (std::vector<std::string>{"DSC003.jpg"}));

    auto exclude_only = scan(card, {}, {"ARW"}).collect();
    EXPECT_EQ(names(exclude_only), (std::vector<std::string>{"DSC003.jpg"}));
}

TEST_F(IngestTest, NoFiltersMatchEveryRegularFile) {
    write_file("a.xmp");
    write_file("b");
    write_file("sub/deeper/c.heic");
    fs::create_directories(card / "empty_dir");

    EXPECT_EQ(scan(card, {}, {}).collect().size(), 3u);
}

TEST_F(IngestTest, ScanIsLazyAndRestartable) {
    write_file("1.jpg");
    write_file("2.jpg");
    write_file("3.png");

    auto s = scan(card, {"jpg"}, {});
    size_t first = 0, second = 0;
    for (const auto& p : s) {
        EXPECT_EQ(p.extension().string(), ".jpg");
        first++;
    }
    for (auto it = s.begin(); it != s.end(); ++it) second++;
    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 2u);
}

TEST_F(IngestTest, CollectIsSorted) {
    write_file("c.jpg");
    write_file("a.jpg");
    write_file("b/z.jpg");

    auto files = scan(card, {}, {}).collect();
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(IngestTest, MissingRootScansNothing) {
    EXPECT_TRUE(scan(card / "nope", {}, {}).collect().empty());
}

TEST(BucketKeyTest, Validation) {
    EXPECT_TRUE(is_valid_bucket_key("2024/05/01"));
    EXPECT_FALSE(is_valid_bucket_key("0000/00/00"));
    EXPECT_FALSE(is_valid_bucket_key("-"));
    EXPECT_FALSE(is_valid_bucket_key(""));
    EXPECT_FALSE(is_valid_bucket_key("2024/13/01"));
    EXPECT_FALSE(is_valid_bucket_key("2024-05-01"));
    EXPECT_FALSE(is_valid_bucket_key("2024/05/01 "));
}

TEST_F(IngestTest, CaptureTimeWins) {
    auto f = write_file("a.arw");
    FakeExtractor ex;
    ex.times.original = "2023/07/04";
    ex.times.created = "2022/01/01";
    ex.times.modified = "2021/01/01";

    DateBucketer bucketer(&ex);
    EXPECT_EQ(bucketer.bucket_key_for(f), "2023/07/04");
    EXPECT_EQ(ex.calls, 1);
}

TEST_F(IngestTest, ZeroedAndMissingDatesFallThrough) {
    auto f = write_file("a.arw");
    FakeExtractor ex;
    ex.times.original = "0000/00/00";
    ex.times.created = "-";
    ex.times.modified = "2021/02/03";

    DateBucketer bucketer(&ex);
    EXPECT_EQ(bucketer.bucket_key_for(f), "2021/02/03");

    ex.times.modified.reset();
    ex.times.created = "2020/12/31";
    EXPECT_EQ(bucketer.bucket_key_for(f), "2020/12/31");
}

TEST_F(IngestTest, FilesystemTimeWhenNoMetadata) {
    auto f = write_file("a.arw");
    std::time_t when = 1625140800;  // 2021-07-01T12:00:00Z
    struct utimbuf times = {when, when};
    ASSERT_EQ(utime(f.c_str(), &times), 0);

    FakeExtractor ex;
    ex.times.original = "0000/00/00";
    DateBucketer bucketer(&ex);
    EXPECT_EQ(bucketer.bucket_key_for(f), date_path_from_time(when));

    DateBucketer no_metadata(nullptr);
    EXPECT_EQ(no_metadata.bucket_key_for(f), date_path_from_time(when));
}

TEST_F(IngestTest, UtcTodayAsLastResort) {
    FakeExtractor ex;
    DateBucketer bucketer(&ex, [] { return static_cast<std::time_t>(1714564800); });
    EXPECT_EQ(bucketer.bucket_key_for(card / "vanished.arw"), "2024/05/01");
}
