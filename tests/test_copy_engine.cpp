#include <gtest/gtest.h>
#include <managers/copy_engine.hpp>
#include <managers/dedup_store.hpp>
#include <managers/hasher.hpp>
#include <managers/ingest.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class FixedDateExtractor : public MetadataExtractor {
public:
    CaptureTimes read(const fs::path&) const override {
        CaptureTimes t;
        t.original = "2024/05/01";
        return t;
    }
};

class CopyEngineTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path card;
    fs::path archive;
    FixedDateExtractor extractor;
    std::unique_ptr<DateBucketer> bucketer;
    std::unique_ptr<DedupStore> store;
    const std::unordered_map<std::string, ContentHash> no_hashes;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("shutterbox_copy_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        card = test_dir / "card" / "DCIM";
        archive = test_dir / "ssd" / "full_dump";
        fs::create_directories(card);
        fs::create_directories(archive);

        bucketer = std::make_unique<DateBucketer>(&extractor);
        store = std::make_unique<DedupStore>(DedupStore::open(test_dir / "hashes.db"));
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_card(const std::string& rel, const std::string& content) {
        auto p = card / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static size_t count_files(const fs::path& root) {
        size_t n = 0;
        for (const auto& e : fs::recursive_directory_iterator(root)) {
            if (e.is_regular_file()) n++;
        }
        return n;
    }
};

TEST_F(CopyEngineTest, CopiesVerifiesAndRecords) {
    auto src = write_card("100MSDCF/DSC001.ARW", "raw bytes");
    CopyEngine engine(*store, *bucketer, archive, false);

    auto out = engine.process_file(src, no_hashes);
    ASSERT_EQ(out.status, CopyStatus::Copied) << out.error;
    EXPECT_EQ(out.destination, archive / "2024/05/01/DSC001.ARW");
    EXPECT_EQ(read(out.destination), "raw bytes");
    EXPECT_EQ(out.size, 9u);

    EXPECT_TRUE(store->exists(out.digest));
    EXPECT_EQ(*store->recorded_destination(out.digest), out.destination);
}

TEST_F(CopyEngineTest, SecondRunCopiesNothing) {
    write_card("a.jpg", "alpha");
    write_card("b.jpg", "beta");
    auto files = scan(card, {}, {}).collect();

    CopyEngine engine(*store, *bucketer, archive, false);
    auto first = engine.run(files, no_hashes);
    EXPECT_EQ(first.copied, 2u);
    EXPECT_EQ(first.copied_bytes, 9u);

    auto second = engine.run(files, no_hashes);
    EXPECT_EQ(second.copied, 0u);
    EXPECT_EQ(second.skipped, 2u);
    EXPECT_EQ(second.errors, 0u);
    EXPECT_EQ(count_files(archive), 2u);
    EXPECT_EQ(store->count(), 2u);
}

TEST_F(CopyEngineTest, IdenticalBytesCopiedOnce) {
    write_card("IMG_0001.JPG", "same");
    write_card("IMG_0002.JPG", "same");
    auto files = scan(card, {}, {}).collect();

    CopyEngine engine(*store, *bucketer, archive, false);
    auto summary = engine.run(files, Hasher(2).digest_batch(files));

    EXPECT_EQ(summary.copied, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(store->count(), 1u);
    EXPECT_EQ(count_files(archive), 1u);
}

TEST_F(CopyEngineTest, SameNameDifferentBytesNeverOverwrites) {
    auto a = write_card("100/IMG_0001.JPG", "first card");
    auto b = write_card("101/IMG_0001.JPG", "second card");

    CopyEngine engine(*store, *bucketer, archive, false);
    auto out_a = engine.process_file(a, no_hashes);
    auto out_b = engine.process_file(b, no_hashes);

    ASSERT_EQ(out_a.status, CopyStatus::Copied);
    ASSERT_EQ(out_b.status, CopyStatus::Copied);
    EXPECT_EQ(out_b.destination, archive / "2024/05/01/IMG_0001_2.JPG");
    EXPECT_EQ(read(out_a.destination), "first card");
    EXPECT_EQ(read(out_b.destination), "second card");
}

TEST_F(CopyEngineTest, ExistingUnrecordedFileIsNotOverwritten) {
    fs::create_directories(archive / "2024/05/01");
    std::ofstream(archive / "2024/05/01/DSC001.ARW") << "already here";
    auto src = write_card("DSC001.ARW", "new content");

    CopyEngine engine(*store, *bucketer, archive, false);
    auto out = engine.process_file(src, no_hashes);
    ASSERT_EQ(out.status, CopyStatus::Copied);
    EXPECT_EQ(out.destination, archive / "2024/05/01/DSC001_2.ARW");
    EXPECT_EQ(read(archive / "2024/05/01/DSC001.ARW"), "already here");
}

TEST_F(CopyEngineTest, UnrecordedCopyFromInterruptedRunIsRecordedInPlace) {
    // A previous run wrote and verified the file, then died before recording it
    fs::create_directories(archive / "2024/05/01");
    std::ofstream(archive / "2024/05/01/DSC001.ARW", std::ios::binary) << "raw bytes";
    auto src = write_card("100MSDCF/DSC001.ARW", "raw bytes");

    CopyEngine engine(*store, *bucketer, archive, false);
    auto out = engine.process_file(src, no_hashes);
    ASSERT_EQ(out.status, CopyStatus::Recovered) << out.error;
    EXPECT_EQ(out.destination, archive / "2024/05/01/DSC001.ARW");
    EXPECT_EQ(count_files(archive), 1u);
    EXPECT_TRUE(store->exists(out.digest));
    EXPECT_EQ(*store->recorded_destination(out.digest), out.destination);

    auto again = engine.process_file(src, no_hashes);
    EXPECT_EQ(again.status, CopyStatus::SkippedDuplicate);
}

TEST_F(CopyEngineTest, DryRunReportsRecoveryWithoutRecording) {
    fs::create_directories(archive / "2024/05/01");
    std::ofstream(archive / "2024/05/01/DSC001.ARW", std::ios::binary) << "raw bytes";
    write_card("DSC001.ARW", "raw bytes");
    auto files = scan(card, {}, {}).collect();

    CopyEngine engine(*store, *bucketer, archive, true);
    auto summary = engine.run(files, no_hashes);
    EXPECT_EQ(summary.recovered, 1u);
    EXPECT_EQ(summary.would_copy, 0u);
    EXPECT_EQ(store->count(), 0u);
    EXPECT_FALSE(fs::exists(test_dir / "hashes.db"));
}

TEST_F(CopyEngineTest, DryRunPlansDistinctNamesWithinBatch) {
    auto a = write_card("100/IMG_0001.JPG", "first card");
    auto b = write_card("101/IMG_0001.JPG", "second card");

    CopyEngine engine(*store, *bucketer, archive, true);
    std::vector<fs::path> destinations;
    auto summary = engine.run({a, b}, no_hashes, [&](size_t, size_t, const CopyOutcome& o) {
        destinations.push_back(o.destination);
    });

    EXPECT_EQ(summary.would_copy, 2u);
    ASSERT_EQ(destinations.size(), 2u);
    EXPECT_EQ(destinations[0], archive / "2024/05/01/IMG_0001.JPG");
    EXPECT_EQ(destinations[1], archive / "2024/05/01/IMG_0001_2.JPG");
    EXPECT_EQ(count_files(archive), 0u);
}

TEST_F(CopyEngineTest, DryRunCountsIdenticalBytesOnce) {
    write_card("IMG_0001.JPG", "same");
    write_card("IMG_0002.JPG", "same");
    auto files = scan(card, {}, {}).collect();

    CopyEngine engine(*store, *bucketer, archive, true);
    auto summary = engine.run(files, no_hashes);
    EXPECT_EQ(summary.would_copy, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.would_copy_bytes, 4u);
}

TEST_F(CopyEngineTest, DryRunHasNoSideEffects) {
    write_card("a.jpg", "alpha");
    write_card("b.jpg", "beta");
    auto files = scan(card, {}, {}).collect();

    CopyEngine engine(*store, *bucketer, archive, true);
    auto summary = engine.run(files, no_hashes);

    EXPECT_EQ(summary.would_copy, 2u);
    EXPECT_EQ(summary.copied, 0u);
    EXPECT_EQ(summary.would_copy_bytes, 9u);
    EXPECT_EQ(store->count(), 0u);
    EXPECT_EQ(count_files(archive), 0u);
    EXPECT_FALSE(fs::exists(archive / "2024"));
    EXPECT_FALSE(fs::exists(test_dir / "hashes.db"));

    // Same input, same decisions
    auto again = engine.run(files, no_hashes);
    EXPECT_EQ(again.would_copy, 2u);
}

TEST_F(CopyEngineTest, PreservesPermissionsAndMtime) {
    auto src = write_card("DSC001.ARW", "raw");
    fs::permissions(src, fs::perms::owner_read | fs::perms::group_read, fs::perm_options::replace);
    auto mtime = fs::last_write_time(src) - std::chrono::hours(48);
    fs::last_write_time(src, mtime);

    CopyEngine engine(*store, *bucketer, archive, false);
    auto out = engine.process_file(src, no_hashes);
    ASSERT_EQ(out.status, CopyStatus::Copied) << out.error;

    EXPECT_EQ(fs::status(out.destination).permissions(), fs::status(src).permissions());
    EXPECT_EQ(fs::last_write_time(out.destination), mtime);
}

TEST_F(CopyEngineTest, DigestMismatchRemovesCopyAndRecordsNothing) {
    auto src = write_card("DSC001.ARW", "raw");
    // A stale precomputed digest no longer matches what lands on disk
    std::unordered_map<std::string, ContentHash> stale = {
        {src.string(), std::string(64, 'a')},
    };

    CopyEngine engine(*store, *bucketer, archive, false);
    auto out = engine.process_file(src, stale);

    EXPECT_EQ(out.status, CopyStatus::Error);
    EXPECT_EQ(out.error_kind, ErrorKind::Integrity);
    EXPECT_FALSE(fs::exists(archive / "2024/05/01/DSC001.ARW"));
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(CopyEngineTest, UnreadableFileDoesNotStopBatch) {
    write_card("a.jpg", "alpha");
    std::vector<fs::path> files = {card / "missing.jpg", card / "a.jpg"};

    CopyEngine engine(*store, *bucketer, archive, false);
    size_t progress_calls = 0;
    auto summary = engine.run(files, no_hashes, [&](size_t i, size_t n, const CopyOutcome&) {
        EXPECT_EQ(n, 2u);
        EXPECT_EQ(i, ++progress_calls);
    });

    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.copied, 1u);
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].error_kind, ErrorKind::IO);
    EXPECT_EQ(progress_calls, 2u);
}
