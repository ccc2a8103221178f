#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path home;

    void SetUp() override {
        home = fs::temp_directory_path() /
               (std::string("shutterbox_config_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(home);
        fs::create_directories(home);
    }

    void TearDown() override {
        fs::remove_all(home);
    }

    Config parse_ok(const std::string& yaml) {
        auto r = Config::parse(yaml, home);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(ConfigTest, Defaults) {
    auto c = parse_ok("server:\n  url: \"\"\n");
    EXPECT_EQ(c.volumes().mount_root, "/Volumes");
    EXPECT_EQ(c.volumes().source_subdir, "DCIM");
    EXPECT_EQ(c.volumes().archive_subdir, "full_dump");
    EXPECT_EQ(c.upload().client, "immich-go");
    EXPECT_EQ(c.upload().concurrent_tasks, 4);
    EXPECT_TRUE(c.upload().pause_jobs);
    EXPECT_EQ(c.mirror().tool, "rsync");
    EXPECT_EQ(c.ingest().include.size(), 12u);
    EXPECT_TRUE(c.ingest().exclude.empty());
}

TEST_F(ConfigTest, UrlWithoutSchemeGetsHttps) {
    auto c = parse_ok("server:\n  url: photos.local:2283\n  api_key: k\n");
    EXPECT_EQ(c.server().url, "https://photos.local:2283");

    auto plain = parse_ok("server:\n  url: http://10.0.0.2\n");
    EXPECT_EQ(plain.server().url, "http://10.0.0.2");
}

TEST_F(ConfigTest, ConcurrentTasksOutOfRangeFallsBack) {
    EXPECT_EQ(parse_ok("upload:\n  concurrent_tasks: 8\n").upload().concurrent_tasks, 8);
    EXPECT_EQ(parse_ok("upload:\n  concurrent_tasks: 50\n").upload().concurrent_tasks, 4);
    EXPECT_EQ(parse_ok("upload:\n  concurrent_tasks: 0\n").upload().concurrent_tasks, 4);
    EXPECT_EQ(parse_ok("upload:\n  concurrent_tasks: lots\n").upload().concurrent_tasks, 4);
}

TEST_F(ConfigTest, ExtensionsAsListOrString) {
    auto list = parse_ok("ingest:\n  include: [ARW, .Jpg]\n");
    ASSERT_EQ(list.ingest().include.size(), 2u);
    EXPECT_EQ(list.ingest().include[0], ".arw");
    EXPECT_EQ(list.ingest().include[1], ".jpg");

    auto csv = parse_ok("upload:\n  exclude: \"MOV, mp4\"\n");
    ASSERT_EQ(csv.upload().exclude.size(), 2u);
    EXPECT_EQ(csv.upload().exclude[0], ".mov");
    EXPECT_EQ(csv.upload().exclude[1], ".mp4");
}

TEST_F(ConfigTest, UnknownMirrorToolIsAnError) {
    auto r = Config::parse("mirror:\n  tool: scp\n", home);
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, VolumePaths) {
    auto c = parse_ok("volumes:\n  mount_root: /mnt\n  source: CARD\n  archive: SSD\n");
    EXPECT_EQ(c.source_root("CARD"), fs::path("/mnt/CARD/DCIM"));
    EXPECT_EQ(c.archive_root("SSD"), fs::path("/mnt/SSD/full_dump"));
    EXPECT_EQ(c.hash_db_path(), home / "hashes.db");
    EXPECT_EQ(c.upload_state_path(), home / "uploads.yaml");

    auto other = c.with_volumes("", "SSD2", "");
    EXPECT_EQ(other.volumes().source, "CARD");
    EXPECT_EQ(other.volumes().archive, "SSD2");
}

TEST_F(ConfigTest, ValidateUploadListsMissingFields) {
    EXPECT_EQ(parse_ok("server:\n  url: x\n").validate_upload().size(), 1u);
    EXPECT_TRUE(parse_ok("server:\n  url: x\n  api_key: y\n").validate_upload().empty());
}

TEST_F(ConfigTest, DefaultConfigIsWrittenOnceAndLoads) {
    ASSERT_FALSE(config_exists(home));
    ASSERT_TRUE(create_default_config(home).is_ok());
    ASSERT_TRUE(config_exists(home));

    auto loaded = Config::load(home);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.validate_upload().size(), 2u);

    {
        std::ofstream out(get_config_path(home));
        out << "server:\n  url: mine\n";
    }
    ASSERT_TRUE(create_default_config(home).is_ok());

    std::ifstream in(get_config_path(home));
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "server:\n  url: mine\n");
}

TEST_F(ConfigTest, LoadWithoutFileFails) {
    EXPECT_TRUE(Config::load(home / "missing").is_err());
}
