// Speeds & Feeds - Logging Tests

#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "core/utils/log.h"

namespace fs = std::filesystem;

namespace {

// Restores the global logger after each test
class LogTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_savedLevel = sfc::log::getLevel();
        m_logPath = fs::temp_directory_path() / "sfc_log_test.log";
        std::error_code ec;
        fs::remove(m_logPath, ec);
        sfc::log::setColorEnabled(false);
    }

    void TearDown() override {
        sfc::log::closeLogFile();
        sfc::log::setLevel(m_savedLevel);
        std::error_code ec;
        fs::remove(m_logPath, ec);
    }

    std::string readLog() const {
        std::ifstream in(m_logPath);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    sfc::log::Level m_savedLevel = sfc::log::Level::Info;
    fs::path m_logPath;
};

} // namespace

TEST(Log, LevelFromInt_Clamps) {
    EXPECT_EQ(sfc::log::levelFromInt(-5), sfc::log::Level::Debug);
    EXPECT_EQ(sfc::log::levelFromInt(0), sfc::log::Level::Debug);
    EXPECT_EQ(sfc::log::levelFromInt(1), sfc::log::Level::Info);
    EXPECT_EQ(sfc::log::levelFromInt(2), sfc::log::Level::Warning);
    EXPECT_EQ(sfc::log::levelFromInt(3), sfc::log::Level::Error);
    EXPECT_EQ(sfc::log::levelFromInt(9), sfc::log::Level::Error);
}

TEST_F(LogTest, FileSink_RecordsModuleAndMessage) {
    sfc::log::setLevel(sfc::log::Level::Info);
    ASSERT_TRUE(sfc::log::setLogFile(m_logPath.string()));
    sfc::log::warningf("Calculator", "rigidity level '%s' unknown", "granite");
    sfc::log::closeLogFile();

    auto text = readLog();
    EXPECT_NE(text.find("[WARN ] [Calculator] rigidity level 'granite' unknown"), std::string::npos);
}

TEST_F(LogTest, FileSink_RespectsLevel) {
    sfc::log::setLevel(sfc::log::Level::Warning);
    ASSERT_TRUE(sfc::log::setLogFile(m_logPath.string()));
    sfc::log::info("Config", "hidden");
    sfc::log::error("Config", "shown");
    sfc::log::closeLogFile();

    auto text = readLog();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(LogTest, FileSink_LongMessageTruncated) {
    sfc::log::setLevel(sfc::log::Level::Debug);
    ASSERT_TRUE(sfc::log::setLogFile(m_logPath.string()));
    std::string longText(2000, 'x');
    sfc::log::debugf("Test", "%s", longText.c_str());
    sfc::log::closeLogFile();

    EXPECT_NE(readLog().find("...[truncated]"), std::string::npos);
}

TEST_F(LogTest, SetLogFile_BadPathFails) {
    EXPECT_FALSE(sfc::log::setLogFile((m_logPath / "no_such_dir" / "x.log").string()));
}
