/**
 * @file test_app_config.cpp
 * @brief Unit tests for environment-based configuration
 */

#include <gtest/gtest.h>
#include <contactbook/config/app_config.h>
#include <contactbook/logging/logger.h>

#include <cstdlib>
#include <string>

using contactbook::config::AppConfig;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        unsetenv("CONTACTBOOK_LOG_LEVEL");
        unsetenv("CONTACTBOOK_LOG_FILE");
        unsetenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS");
    }
};

TEST_F(AppConfigTest, Defaults) {
    auto config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.logLevel, "warn");
    EXPECT_EQ(config.logFile, "");
    EXPECT_EQ(config.birthdayWindowDays, 7);
}

TEST_F(AppConfigTest, ReadsEnvironment) {
    setenv("CONTACTBOOK_LOG_LEVEL", " DEBUG ", 1);
    setenv("CONTACTBOOK_LOG_FILE", "/tmp/contactbook.log", 1);
    setenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS", "14", 1);

    auto config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.logFile, "/tmp/contactbook.log");
    EXPECT_EQ(config.birthdayWindowDays, 14);
}

TEST_F(AppConfigTest, WindowIsClamped) {
    setenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS", "-3", 1);
    EXPECT_EQ(AppConfig::fromEnvironment().birthdayWindowDays, 0);

    setenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS", "1000", 1);
    EXPECT_EQ(AppConfig::fromEnvironment().birthdayWindowDays, AppConfig::MAX_WINDOW_DAYS);
}

TEST_F(AppConfigTest, InvalidWindowFallsBackToDefault) {
    for (const char* raw : {"", "abc", "7days", "99999999999999999999"}) {
        setenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS", raw, 1);
        EXPECT_EQ(AppConfig::fromEnvironment().birthdayWindowDays, 7) << raw;
    }
}

TEST_F(AppConfigTest, EnvStoi) {
    EXPECT_EQ(AppConfig::envStoi(" 10 ", 7, 0, 365), 10);
    EXPECT_EQ(AppConfig::envStoi("x", 7, 0, 365), 7);
    EXPECT_EQ(AppConfig::envStoi("400", 7, 0, 365), 365);
}

TEST_F(AppConfigTest, InvalidValueWarningGoesToStderrOnly) {
    contactbook::logging::Logger::initialize("contactbook-test");
    setenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS", "abc", 1);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    auto config = AppConfig::fromEnvironment();
    contactbook::logging::Logger::flush();
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(config.birthdayWindowDays, 7);
    EXPECT_EQ(out, "");
    EXPECT_NE(err.find("Invalid integer env value 'abc'"), std::string::npos);
}
