/**
 * @file test_logger.cpp
 * @brief Level names and the optional file sink
 */

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "logger.hpp"
#include "tests/test_support.hpp"

TEST(Logger, ParsesConfigLevelNames) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_TRUE(parseLogLevel("CRITICAL", level));
    EXPECT_EQ(level, LogLevel::Error);

    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Error);
}

TEST(Logger, FileSinkHonoursLevel) {
    vltest::TempDir dir;
    std::string path = (dir.path() / "voicelaunch.log").string();

    ASSERT_TRUE(initLogger(path));
    setLogLevel(LogLevel::Warn);
    LOG_INFO("Test", "hidden line");
    LOG_WARN("Test", "visible line key=1");
    setLogLevel(LogLevel::Info);
    shutdownLogger();

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();

    EXPECT_EQ(text.str().find("hidden line"), std::string::npos);
    EXPECT_NE(text.str().find("[WARN][Test] visible line key=1"), std::string::npos);
}

TEST(Logger, PhaseGroupIsWrittenOnEnd) {
    vltest::TempDir dir;
    std::string path = (dir.path() / "phases.log").string();

    ASSERT_TRUE(initLogger(path));
    beginPhaseGroup();
    LOG_PHASE("Config loaded", true);
    LOG_PHASE("Audio source open", false);
    endPhaseGroup();
    shutdownLogger();

    EXPECT_EQ(g_phaseInfo.phaseName, "Audio source open");
    EXPECT_FALSE(g_phaseInfo.success);
    EXPECT_EQ(g_phaseInfo.fileName, "test_logger.cpp");

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_NE(text.str().find("[PHASE][test_logger.cpp] Config loaded ok=true"), std::string::npos);
    EXPECT_NE(text.str().find("Audio source open ok=false"), std::string::npos);
}
