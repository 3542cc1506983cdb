#pragma once

/**
 * @file app_config.h
 * @brief Application configuration loaded from environment variables
 */

#include <string>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "contactbook/domain/model/Directory.hpp"
#include "contactbook/utils/string_utils.h"

namespace contactbook::config {

struct AppConfig {
    std::string logLevel = "warn";
    std::string logFile;  // Empty: console only
    int birthdayWindowDays = domain::model::Directory::DEFAULT_WINDOW_DAYS;

    static constexpr int MAX_WINDOW_DAYS = 365;

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
        try {
            size_t consumed = 0;
            std::string text = utils::trim(val);
            int v = std::stoi(text, &consumed);
            if (consumed != text.size()) {
                throw std::invalid_argument(text);
            }
            return std::clamp(v, minVal, maxVal);
        } catch (const std::logic_error&) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
            return defaultVal;
        }
    }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("CONTACTBOOK_LOG_LEVEL")) {
            config.logLevel = utils::toLower(utils::trim(val));
        }
        if (auto val = std::getenv("CONTACTBOOK_LOG_FILE")) {
            config.logFile = utils::trim(val);
        }
        if (auto val = std::getenv("CONTACTBOOK_BIRTHDAY_WINDOW_DAYS")) {
            config.birthdayWindowDays = envStoi(
                val, domain::model::Directory::DEFAULT_WINDOW_DAYS, 0, MAX_WINDOW_DAYS);
        }

        return config;
    }
};

} // namespace contactbook::config
