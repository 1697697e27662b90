#include <gtest/gtest.h>

#include "logger.hpp"

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("loud", LogLevel::Warn), LogLevel::Warn);
}

TEST(LoggerTest, PhaseRecordsLastReached) {
    LOG_PHASE("Logger test phase", false);
    EXPECT_EQ(g_phaseInfo.phaseName, "Logger test phase");
    EXPECT_EQ(g_phaseInfo.fileName, "test_logger.cpp");
    EXPECT_FALSE(g_phaseInfo.success);
}

TEST(LoggerTest, GroupedPhasesStillRecorded) {
    beginPhaseGroup();
    LOG_PHASE("Grouped", true);
    endPhaseGroup();
    EXPECT_EQ(g_phaseInfo.phaseName, "Grouped");
    EXPECT_TRUE(g_phaseInfo.success);
}
