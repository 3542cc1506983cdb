/**
 * @file main.cpp
 * @brief Contact book assistant entry point
 *
 * Interactive line-oriented bot over an in-memory contact directory.
 */

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

#include "contactbook/application/CommandDispatcher.hpp"
#include "contactbook/application/CommandParser.hpp"
#include "contactbook/config/app_config.h"
#include "contactbook/domain/model/Directory.hpp"
#include "contactbook/logging/logger.h"
#include "contactbook/utils/string_utils.h"

using namespace contactbook;

int main() {
    // Config parsing may warn: stderr logger before reading it
    logging::Logger::initialize("contactbook");
    auto config = config::AppConfig::fromEnvironment();
    logging::Logger::initialize("contactbook", config.logLevel, config.logFile);

    spdlog::info("Birthday window: {} days", config.birthdayWindowDays);

    domain::model::Directory directory;
    application::CommandDispatcher dispatcher(config.birthdayWindowDays);
    spdlog::debug("Commands: {}", utils::join(dispatcher.commandNames(), ", "));

    std::cout << "Welcome to the assistant bot!" << std::endl;

    std::string line;
    while (true) {
        std::cout << "Enter a command: " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << std::endl << "Good bye!" << std::endl;
            break;
        }

        auto parsed = application::parseInput(line);
        std::cout << dispatcher.execute(parsed, directory) << std::endl;

        if (dispatcher.isExitCommand(parsed.command)) {
            break;
        }
    }

    spdlog::info("Session ended with {} contacts", directory.size());
    logging::Logger::flush();
    return 0;
}
