#include <gtest/gtest.h>
#include <managers/dedup_store.hpp>
#include <managers/content_index.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class DedupStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path db;
    fs::path archive;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("shutterbox_dedup_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        db = test_dir / "hashes.db";
        archive = test_dir / "full_dump";
        fs::create_directories(archive);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const fs::path& rel, const std::string& content) {
        auto p = archive / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

    static std::string fake_digest(int n) {
        return fmt::format("{:064x}", n);
    }

    std::string read_db() {
        std::ifstream in(db);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(DedupStoreTest, ExactMatchOnly) {
    auto store = DedupStore::open(db);
    auto digest = fake_digest(0xabc);
    store.add(digest, "/card/DCIM/A.ARW", archive / "2024/05/01/A.ARW", 10);

    EXPECT_TRUE(store.exists(digest));
    EXPECT_FALSE(store.exists(digest.substr(0, 32)));
    EXPECT_FALSE(store.exists(digest.substr(1)));
    EXPECT_FALSE(store.exists(digest + "0"));
    EXPECT_FALSE(store.exists(""));
}

TEST_F(DedupStoreTest, RecordsSurviveReopen) {
    auto digest = fake_digest(1);
    {
        auto store = DedupStore::open(db);
        store.add(digest, "/card/DCIM/A.ARW", archive / "2024/05/01/A.ARW", 42);
    }

    auto store = DedupStore::open(db);
    EXPECT_EQ(store.count(), 1u);
    auto dest = store.recorded_destination(digest);
    ASSERT_TRUE(dest.has_value());
    EXPECT_EQ(*dest, archive / "2024/05/01/A.ARW");
    EXPECT_FALSE(store.recorded_destination(fake_digest(2)).has_value());
}

TEST_F(DedupStoreTest, LogLineFormat) {
    auto store = DedupStore::open(db);
    store.add(fake_digest(7), "/card/x.jpg", "/ssd/full_dump/2024/01/02/x.jpg", 1234);

    std::string line = read_db();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find(fake_digest(7) + "\t/card/x.jpg\t/ssd/full_dump/2024/01/02/x.jpg\t"), 0u);
    EXPECT_NE(line.find("\t1234\n"), std::string::npos);
}

TEST_F(DedupStoreTest, CollisionFreeNames) {
    auto store = DedupStore::open(db);
    fs::path dir = archive / "2024/05/01";

    EXPECT_EQ(store.resolve_collision_free_name(dir, "IMG_0001", ".ARW"), dir / "IMG_0001.ARW");

    // Present on disk only
    write_file("2024/05/01/IMG_0001.ARW", "first");
    EXPECT_EQ(store.resolve_collision_free_name(dir, "IMG_0001", ".ARW"), dir / "IMG_0001_2.ARW");

    // Recorded only
    store.add(fake_digest(2), "/card/b", dir / "IMG_0001_2.ARW", 1);
    EXPECT_EQ(store.resolve_collision_free_name(dir, "IMG_0001", ".ARW"), dir / "IMG_0001_3.ARW");

    EXPECT_TRUE(store.destination_exists(dir / "IMG_0001.ARW"));
    EXPECT_TRUE(store.destination_exists(dir / "IMG_0001_2.ARW"));
    EXPECT_FALSE(store.destination_exists(dir / "IMG_0001_3.ARW"));
}

TEST_F(DedupStoreTest, CollisionBoundIsEnforced) {
    DedupStore store(std::make_unique<MemoryContentIndex>());
    fs::path dir = "/nonexistent/2024/05/01";

    store.add(fake_digest(1), "/card", dir / "IMG.jpg", 1);
    for (int n = 2; n <= MAX_COLLISION_SUFFIX; n++) {
        store.add(fake_digest(n), "/card", dir / fmt::format("IMG_{}.jpg", n), 1);
    }

    try {
        store.resolve_collision_free_name(dir, "IMG", ".jpg");
        FAIL() << "expected CollisionExhausted";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CollisionExhausted);
    }

    // Any other base name is still free
    EXPECT_EQ(store.resolve_collision_free_name(dir, "OTHER", ".jpg"), dir / "OTHER.jpg");
}

TEST_F(DedupStoreTest, DuplicateDigestOrDestinationRejected) {
    auto store = DedupStore::open(db);
    store.add(fake_digest(1), "/card/a", archive / "a.jpg", 1);

    try {
        store.add(fake_digest(1), "/card/b", archive / "b.jpg", 1);
        FAIL() << "expected StateCorruption";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StateCorruption);
    }
    EXPECT_THROW(store.add(fake_digest(2), "/card/c", archive / "a.jpg", 1), PipelineError);
    EXPECT_EQ(DedupStore::open(db).count(), 1u);
}

TEST_F(DedupStoreTest, TabInPathRejected) {
    auto store = DedupStore::open(db);
    try {
        store.add(fake_digest(1), "/card/a", archive / "bad\tname.jpg", 1);
        FAIL() << "expected IOError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IO);
    }
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(DedupStoreTest, MalformedLinesAreSkipped) {
    {
        std::ofstream out(db);
        out << fake_digest(1) << "\t/card/a\t/ssd/a.jpg\t2024-05-01T10:00:00\t5\n";
        out << "garbage line\n";
        out << "abc123\t/card/b\t/ssd/b.jpg\t2024-05-01T10:00:00\t5\n";
        out << fake_digest(3) << "\t/card/c\t/ssd/c.jpg\t2024-05-01T10:00:00\tnot-a-size\n";
        out << fake_digest(1) << "\t/card/d\t/ssd/d.jpg\t2024-05-01T10:00:00\t5\n";
    }

    LogContentIndex index(db);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.corrupt_entries().size(), 4u);
    EXPECT_FALSE(index.find(fake_digest(3)).has_value());

    auto problems = LogContentIndex::validate(db);
    ASSERT_EQ(problems.size(), 4u);
    EXPECT_EQ(problems[0].line_number, 2u);
    EXPECT_EQ(problems[3].line_number, 5u);
}

TEST_F(DedupStoreTest, TornLastLineDoesNotSwallowNextRecord) {
    {
        std::ofstream out(db);
        out << fake_digest(1) << "\t/card/a\t/ssd/a.jpg\t2024-05-01T10:00:00\t5";
    }
    {
        auto store = DedupStore::open(db);
        EXPECT_EQ(store.count(), 1u);
        store.add(fake_digest(2), "/card/b", "/ssd/b.jpg", 6);
    }
    EXPECT_EQ(DedupStore::open(db).count(), 2u);
}

TEST_F(DedupStoreTest, RebuildReplacesStoreAndKeepsBackup) {
    auto one = write_file("2024/01/01/a.jpg", "one");
    auto two = write_file("2024/01/02/b.jpg", "two");
    write_file("2024/01/03/c.jpg", "one");

    auto store = DedupStore::open(db);
    store.add(fake_digest(99), "/card/old", archive / "gone.jpg", 3);

    auto summary = store.rebuild(archive, Hasher(2));
    EXPECT_EQ(summary.files_found, 3u);
    EXPECT_EQ(summary.records, 2u);
    EXPECT_EQ(summary.duplicate_content, 1u);
    EXPECT_EQ(summary.unreadable, 0u);

    EXPECT_FALSE(store.exists(fake_digest(99)));
    EXPECT_TRUE(fs::exists(db.string() + ".bak"));

    auto rec = LogContentIndex(db).find(Hasher::digest(two));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->source_path, UNKNOWN_ORIGIN);
    EXPECT_EQ(fs::path(rec->dest_path), two);
    EXPECT_EQ(rec->size, 3u);

    // First path in sorted order wins for repeated content
    EXPECT_EQ(*store.recorded_destination(Hasher::digest(one)), one);

    EXPECT_EQ(DedupStore::open(db).count(), 2u);
}

TEST_F(DedupStoreTest, RebuildAfterCorruptionRecordsBytesOnDisk) {
    auto photo = write_file("2024/05/01/IMG_0001.ARW", "original bytes");
    auto store = DedupStore::open(db);
    auto original = Hasher::digest(photo);
    store.add(original, "/card/DCIM/IMG_0001.ARW", photo, 14);

    // Bit rot on the archive
    std::ofstream(photo, std::ios::binary | std::ios::trunc) << "corrupted bytes";
    auto corrupted = Hasher::digest(photo);
    ASSERT_NE(original, corrupted);

    store.rebuild(archive, Hasher(1));

    EXPECT_FALSE(store.exists(original));
    ASSERT_TRUE(store.exists(corrupted));
    auto rec = LogContentIndex(db).find(corrupted);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->source_path, UNKNOWN_ORIGIN);
    EXPECT_EQ(fs::path(rec->dest_path), photo);
}

TEST_F(DedupStoreTest, RebuildReportsProgress) {
    write_file("2024/05/01/a.jpg", "a");
    write_file("2024/05/02/b.jpg", "b");
    auto store = DedupStore::open(db);

    std::vector<std::string> messages;
    store.rebuild(archive, Hasher(1), [&](const std::string& m) { messages.push_back(m); });
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages[0].find("Hashing 2 files"), std::string::npos);
}

TEST_F(DedupStoreTest, MemoryIndexBehavesLikeLog) {
    DedupStore store(std::make_unique<MemoryContentIndex>());
    store.add(fake_digest(5), "/card/a", "/ssd/./2024/a.jpg", 1);
    EXPECT_TRUE(store.exists(fake_digest(5)));
    EXPECT_TRUE(store.destination_exists("/ssd/2024/a.jpg"));
    EXPECT_EQ(store.count(), 1u);
}
