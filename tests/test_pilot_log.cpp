// =============================================================================
// Unit tests for the logger (level parsing, formatting, file sink)
// =============================================================================
#include <gtest/gtest.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include "pilot_log.hpp"

using namespace pilot;

namespace {

class LogFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/pilot_log_XXXXXX";
        int fd = mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        close(fd);
        path_ = tmpl;
        saved_level_ = log::logLevel();
        log::setConsoleOutput(false);
        ASSERT_TRUE(log::openLogFile(path_.c_str()));
    }

    void TearDown() override {
        log::closeLogFile();
        log::setLogLevel(saved_level_);
        log::setConsoleOutput(true);
        unlink(path_.c_str());
    }

    std::string contents() {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
    log::Level saved_level_ = log::Level::Info;
};

} // namespace

TEST(LogLevelTest, ParseConfigSpelling) {
    EXPECT_EQ(log::parseLevel("trace"), log::Level::Trace);
    EXPECT_EQ(log::parseLevel("debug"), log::Level::Debug);
    EXPECT_EQ(log::parseLevel("warn"), log::Level::Warn);
    EXPECT_EQ(log::parseLevel("warning"), log::Level::Warn);
    EXPECT_EQ(log::parseLevel("error"), log::Level::Error);
    EXPECT_EQ(log::parseLevel("fatal"), log::Level::Fatal);
    EXPECT_EQ(log::parseLevel("info"), log::Level::Info);
    EXPECT_EQ(log::parseLevel("loud"), log::Level::Info);
}

TEST(LogFormatTest, LineLayout) {
    auto when = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(42);
    std::string line = log::formatLine(when, log::Level::Warn, "lock", 1234, "stale lock");

    // HH:MM:SS.mmm depends on the local zone; the rest is fixed
    ASSERT_GE(line.size(), 13u);
    EXPECT_EQ(line.substr(8, 5), ".042 ");
    EXPECT_EQ(line.substr(13), "[WARN ] [lock] (T1234) stale lock");
}

TEST_F(LogFileTest, WritesAtOrAboveLevel) {
    log::setLogLevel(log::Level::Info);
    PLOG_DEBUG("test", "hidden %d", 1);
    PLOG_INFO("test", "shown %d", 2);
    PLOG_ERROR("test", "shown %s", "too");

    std::string text = contents();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[INFO ] [test]"), std::string::npos);
    EXPECT_NE(text.find("shown 2"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] [test]"), std::string::npos);
}

TEST_F(LogFileTest, LevelCanBeLowered) {
    log::setLogLevel(log::Level::Trace);
    EXPECT_TRUE(log::enabled(log::Level::Trace));
    PLOG_TRACE("test", "very chatty");
    EXPECT_NE(contents().find("very chatty"), std::string::npos);
}

TEST_F(LogFileTest, ReopenTruncates) {
    PLOG_WARN("test", "first run");
    ASSERT_TRUE(log::openLogFile(path_.c_str()));
    PLOG_WARN("test", "second run");

    std::string text = contents();
    EXPECT_EQ(text.find("first run"), std::string::npos);
    EXPECT_NE(text.find("second run"), std::string::npos);
}

TEST_F(LogFileTest, OpenFailsForMissingDirectory) {
    EXPECT_FALSE(log::openLogFile("/nonexistent-dir/pilot.log"));
    // Logging without a file must still be safe
    PLOG_ERROR("test", "no sink");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
