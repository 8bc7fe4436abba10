#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include "utils/ConsoleLogger.hpp"

using ::testing::HasSubstr;
using ::testing::ContainsRegex;

TEST(ConsoleLoggerTest, WritesTimestampedLevelLines) {
    ConsoleLogger logger(LogLevel::DEBUG);
    ::testing::internal::CaptureStdout();
    logger.info("Backup completed");
    std::string output = ::testing::internal::GetCapturedStdout();
    EXPECT_THAT(output, ContainsRegex("\\[[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\\] \\[INFO\\] Backup completed"));
    EXPECT_EQ('\n', output.back());
}

TEST(ConsoleLoggerTest, ErrorsGoToStderr) {
    ConsoleLogger logger;
    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger.error("engine failed");
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out.empty());
    EXPECT_THAT(err, HasSubstr("[ERROR] engine failed"));
}

TEST(ConsoleLoggerTest, MessagesBelowLevelAreDropped) {
    ConsoleLogger logger(LogLevel::WARNING);
    ::testing::internal::CaptureStdout();
    logger.debug("hidden");
    logger.info("hidden too");
    logger.warn("shown");
    std::string output = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(std::string::npos, output.find("hidden"));
    EXPECT_THAT(output, HasSubstr("[WARN] shown"));

    logger.setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(LogLevel::DEBUG, logger.getLogLevel());
}
