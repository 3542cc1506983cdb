/**
 * @file test_logger.cpp
 * @brief Unit tests for logger configuration
 */

#include <gtest/gtest.h>
#include <contactbook/logging/logger.h>

using contactbook::logging::Logger;

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, ParseLevel_UnknownFallsBackToWarn) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel(""), spdlog::level::warn);
}

TEST(LoggerTest, InitializeInstallsDefaultLogger) {
    Logger::initialize("contactbook-test", "error");

    auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "contactbook-test");
    EXPECT_EQ(logger->level(), spdlog::level::err);
    Logger::flush();
}
