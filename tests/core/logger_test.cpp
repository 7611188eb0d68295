/**
 * @file logger_test.cpp
 * @brief Logger level, tag and file output tests
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/core/logger.h"

#include <fstream>
#include <iterator>

using namespace dualmeter::core;

class LoggerTest : public DualmeterTest {
protected:
    void TearDown() override {
        Logger::instance().close_output_file();
        Logger::instance().set_level(LogLevel::INFO);
    }

    std::string read_log() {
        std::ifstream in(dir_.path() / "test.log");
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    TempDir dir_;
};

TEST(LogLevelTest, ParseNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("off", level));
    EXPECT_EQ(level, LogLevel::NONE);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::NONE);

    for (LogLevel l : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
        LogLevel parsed = LogLevel::NONE;
        EXPECT_TRUE(parse_log_level(log_level_name(l), parsed));
        EXPECT_EQ(parsed, l);
    }
}

#ifdef DUALMETER_ENABLE_LOGGING
TEST_F(LoggerTest, FileOutputAndLevelFilter) {
    auto& logger = Logger::instance();
    std::string path = (dir_.path() / "test.log").string();
    ASSERT_TRUE(logger.set_output_file(path.c_str()));
    logger.set_level(LogLevel::WARN);

    LOG_INFO("Server", "hidden %d", 1);
    LOG_WARN("Server", "visible conn=%d", 7);
    LOG_ERROR("QUIC", "failure %s", "here");
    logger.close_output_file();

    std::string text = read_log();
    EXPECT_THAT(text, ::testing::Not(::testing::HasSubstr("hidden")));
    EXPECT_THAT(text, ::testing::HasSubstr("Z [WARN ] [Server] visible conn=7 (logger_test.cpp:"));
    EXPECT_THAT(text, ::testing::HasSubstr("[ERROR] [QUIC] failure here"));
}

TEST_F(LoggerTest, DisabledTagIsDropped) {
    auto& logger = Logger::instance();
    std::string path = (dir_.path() / "test.log").string();
    ASSERT_TRUE(logger.set_output_file(path.c_str()));

    logger.set_tag_enabled("Router", false);
    LOG_INFO("Router", "muted");
    LOG_INFO("Content", "kept");
    logger.set_tag_enabled("Router", true);
    logger.close_output_file();

    std::string text = read_log();
    EXPECT_THAT(text, ::testing::Not(::testing::HasSubstr("muted")));
    EXPECT_THAT(text, ::testing::HasSubstr("kept"));
}
#endif

TEST_F(LoggerTest, UnwritableFileFails) {
    EXPECT_FALSE(Logger::instance().set_output_file("/nonexistent-dir/x/y.log"));
}
