/**
 * @file CommandDispatcher.cpp
 * @brief Command dispatch implementation
 */

#include "contactbook/application/CommandDispatcher.hpp"
#include "contactbook/application/CommandHandlers.hpp"

#include <spdlog/spdlog.h>
#include <optional>
#include <stdexcept>

namespace contactbook::application {

using domain::model::CalendarDate;
using domain::model::Directory;

namespace {

constexpr const char* EXIT_COMMANDS[] = {"close", "exit"};

} // namespace

CommandDispatcher::CommandDispatcher(int birthdayWindowDays, Clock clock)
    : birthdayWindowDays_(birthdayWindowDays),
      clock_(std::move(clock))
{
    if (!clock_) {
        throw std::invalid_argument("CommandDispatcher: clock cannot be empty");
    }
    registerDefaults();
}

void CommandDispatcher::registerDefaults() {
    registerHandler("add", addContact);
    registerHandler("change", changeContact);
    registerHandler("phone", showPhone);
    registerHandler("remove-phone", removePhone);
    registerHandler("delete", deleteContact);
    registerHandler("all", [](const Args&, Directory& directory) {
        return showAll(directory);
    });
    registerHandler("add-birthday", addBirthday);
    registerHandler("show-birthday", showBirthday);
    registerHandler("birthdays", [this](const Args&, Directory& directory) {
        std::optional<CalendarDate> today;
        try {
            today = clock_();
        } catch (const std::runtime_error& e) {
            spdlog::error("Cannot read today's date: {}", e.what());
            return std::string(DATE_UNAVAILABLE_MESSAGE);
        }
        return showUpcomingBirthdays(directory, *today, birthdayWindowDays_);
    });
}

void CommandDispatcher::registerHandler(const std::string& name, Handler handler) {
    handlers_[name] = std::move(handler);
}

std::string CommandDispatcher::execute(const ParsedCommand& command, Directory& directory) const {
    if (command.isEmpty()) {
        return "Enter a command.";
    }
    if (isExitCommand(command.command)) {
        return "Good bye!";
    }
    if (command.command == "hello") {
        return "How can I help you?";
    }

    auto it = handlers_.find(command.command);
    if (it == handlers_.end()) {
        spdlog::debug("Unknown command: {}", command.command);
        return "Invalid command.";
    }

    const Handler& handler = it->second;
    return guardHandler(command.command, [&]() {
        return handler(command.args, directory);
    });
}

bool CommandDispatcher::isExitCommand(const std::string& command) const {
    for (const char* exitCommand : EXIT_COMMANDS) {
        if (command == exitCommand) return true;
    }
    return false;
}

std::vector<std::string> CommandDispatcher::commandNames() const {
    std::vector<std::string> names;
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace contactbook::application
