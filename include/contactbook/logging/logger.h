/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the contact book's standard configuration.
 * Console output goes to stderr so it never interleaves with the
 * bot's dialogue on stdout.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace contactbook::logging {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to spdlog's level
     * @param logLevel trace, debug, info, warn, error, critical or off
     * @return The level; warn for an unknown name
     */
    static spdlog::level::level_enum parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") return spdlog::level::trace;
        if (logLevel == "debug") return spdlog::level::debug;
        if (logLevel == "info") return spdlog::level::info;
        if (logLevel == "warn") return spdlog::level::warn;
        if (logLevel == "error") return spdlog::level::err;
        if (logLevel == "critical") return spdlog::level::critical;
        if (logLevel == "off") return spdlog::level::off;
        return spdlog::level::warn;
    }

    /**
     * @brief Initialize the default logger
     * @param appName Logger name shown in each line
     * @param logLevel Level name (see parseLevel)
     * @param logFile Rotating log file path; empty disables file logging
     */
    static void initialize(
        const std::string& appName,
        const std::string& logLevel = "warn",
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 5, 3  // 5MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: app={}, level={}, file={}",
                         appName, logLevel, logFile.empty() ? "none" : logFile);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Flush all loggers
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace contactbook::logging
