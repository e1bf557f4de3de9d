#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "logger.h"

#include <string>

using namespace peerwire;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::getInstance().get_log_level();
        Logger::getInstance().set_colors_enabled(false);
        Logger::getInstance().set_timestamps_enabled(false);
    }

    void TearDown() override {
        Logger::getInstance().set_log_level(saved_level_);
        Logger::getInstance().set_timestamps_enabled(true);
        Logger::getInstance().set_colors_enabled(true);
    }

    LogLevel saved_level_;
};

TEST_F(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;

    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level("WARN", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parse_level("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parse_level("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_FALSE(Logger::parse_level("verbose", level));
    EXPECT_FALSE(Logger::parse_level("", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, LevelFilter) {
    Logger::getInstance().set_log_level(LogLevel::WARN);
    EXPECT_FALSE(Logger::getInstance().is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::getInstance().is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::getInstance().is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::getInstance().is_enabled(LogLevel::ERROR));

    testing::internal::CaptureStdout();
    LOG_INFO("test", "hidden " << 1);
    LOG_WARN("test", "shown " << 2);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_THAT(out, Not(HasSubstr("hidden")));
    EXPECT_THAT(out, HasSubstr("shown 2"));
}

TEST_F(LoggerTest, FormatCarriesLevelAndModule) {
    Logger::getInstance().set_log_level(LogLevel::DEBUG);

    testing::internal::CaptureStdout();
    LOG_DEBUG("codec", "frame " << 42 << " decoded");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[DEBUG] [codec] frame 42 decoded\n");
}

TEST_F(LoggerTest, ErrorsGoToStderr) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    LOG_ERROR("store", "write failed");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err, "[ERROR] [store] write failed\n");
}
