/**
 * @file CommandDispatcher.hpp
 * @brief Dispatch table from command names to handlers
 */

#pragma once

#include "CommandParser.hpp"
#include "contactbook/domain/model/Directory.hpp"
#include "contactbook/domain/model/CalendarDate.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace contactbook::application {

/// Reply to "birthdays" when the clock fails
inline constexpr const char* DATE_UNAVAILABLE_MESSAGE = "Error: Cannot determine today's date.";

/**
 * @brief Routes a parsed command to its handler
 *
 * Usage:
 * @code
 *   CommandDispatcher dispatcher(7);
 *   std::string reply = dispatcher.execute(parseInput(line), directory);
 *   if (dispatcher.isExitCommand(...)) ...
 * @endcode
 */
class CommandDispatcher {
public:
    using Handler = std::function<std::string(const Args&, domain::model::Directory&)>;
    using Clock = std::function<domain::model::CalendarDate()>;

    /**
     * @brief Constructor; registers the built-in contact commands
     * @param birthdayWindowDays Look-ahead used by "birthdays"
     * @param clock Source of "today" for "birthdays"; a std::runtime_error from it
     *        becomes DATE_UNAVAILABLE_MESSAGE
     * @throws std::invalid_argument if clock is empty
     */
    explicit CommandDispatcher(int birthdayWindowDays, Clock clock = &domain::model::CalendarDate::today);

    // Handlers capture this dispatcher
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /**
     * @brief Add or replace a handler
     */
    void registerHandler(const std::string& name, Handler handler);

    /**
     * @brief Run one command and return the reply text
     *
     * Never throws for domain or argument errors; those become the reply.
     */
    std::string execute(const ParsedCommand& command, domain::model::Directory& directory) const;

    [[nodiscard]] bool isExitCommand(const std::string& command) const;

    /**
     * @brief Registered handler names, sorted
     */
    [[nodiscard]] std::vector<std::string> commandNames() const;

private:
    std::map<std::string, Handler> handlers_;
    int birthdayWindowDays_;
    Clock clock_;

    void registerDefaults();
};

} // namespace contactbook::application
