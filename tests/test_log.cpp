#include <gtest/gtest.h>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class LogTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("shutterbox_log_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        log_init("", false);
        fs::remove_all(test_dir);
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LogTest, WritesLevelTaggedLines) {
    auto path = test_dir / "logs" / "shutterbox.log";
    log_init(path, false);
    EXPECT_EQ(log_path(), path);

    log_info("copied {} files", 3);
    log_error("{}: {}", "IntegrityError", "mismatch");
    log_debug("hidden");

    auto text = read(path);
    EXPECT_NE(text.find("[INFO ] copied 3 files\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] IntegrityError: mismatch\n"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
}

TEST_F(LogTest, VerboseKeepsDebug) {
    auto path = test_dir / "app.log";
    log_init(path, true);
    log_debug("walk {}", "/card");
    EXPECT_NE(read(path).find("[DEBUG] walk /card"), std::string::npos);
}

TEST_F(LogTest, UninitialisedIsSilent) {
    log_init("", false);
    log_warn("nowhere");
    EXPECT_TRUE(log_path().empty());
    EXPECT_FALSE(fs::exists(test_dir));
}
