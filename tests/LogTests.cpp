// tests/LogTests.cpp
// Log level parsing and threshold filtering.

#include "LoopFlowErrors.hpp"
#include "LoopFlowLog.hpp"
#include <gtest/gtest.h>

using namespace LoopFlow;

TEST(Log, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_THROW(parseLogLevel("verbose"), ConfigurationError);
    EXPECT_STREQ(logLevelName(LogLevel::Info), "info");
}

TEST(Log, ThresholdFiltersLowerLevels) {
    const LogLevel saved = logLevel();

    setLogLevel(LogLevel::Warn);
    EXPECT_TRUE(logEnabled(LogLevel::Error));
    EXPECT_TRUE(logEnabled(LogLevel::Warn));
    EXPECT_FALSE(logEnabled(LogLevel::Info));

    setLogLevel(LogLevel::Debug);
    EXPECT_TRUE(logEnabled(LogLevel::Debug));

    testing::internal::CaptureStderr();
    logDebug("iteration {}", 3);
    setLogLevel(LogLevel::Error);
    logInfo("hidden");
    const std::string captured = testing::internal::GetCapturedStderr();
    EXPECT_EQ(captured, "[loopflow:debug] iteration 3\n");

    setLogLevel(saved);
}
