/**
 * @file CommandHandlers.hpp
 * @brief Handlers translating parsed arguments into Directory/Record operations
 *
 * Every handler returns the text shown to the user. Handlers may throw
 * DomainException (bad field values) or ApplicationException (missing
 * arguments); guardHandler() turns those into their message text, so
 * nothing propagates past the dispatcher.
 */

#pragma once

#include "CommandParser.hpp"
#include "contactbook/domain/model/Directory.hpp"
#include "contactbook/domain/model/CalendarDate.hpp"
#include <functional>
#include <string>

namespace contactbook::application {

/// Message for a command called without its required arguments
inline constexpr const char* MISSING_ARGUMENT_MESSAGE = "Enter the argument for the command.";

/**
 * @brief Run a handler, converting domain/application failures to their message
 * @param command Command name (for logging)
 * @param action The handler call
 * @return The handler's output, or the failure message
 */
std::string guardHandler(const std::string& command, const std::function<std::string()>& action);

/// add <name> [phone]
std::string addContact(const Args& args, domain::model::Directory& directory);

/// change <name> <old phone> <new phone>
std::string changeContact(const Args& args, domain::model::Directory& directory);

/// phone <name>
std::string showPhone(const Args& args, const domain::model::Directory& directory);

/// remove-phone <name> <phone>
std::string removePhone(const Args& args, domain::model::Directory& directory);

/// delete <name>
std::string deleteContact(const Args& args, domain::model::Directory& directory);

/// all
std::string showAll(const domain::model::Directory& directory);

/// add-birthday <name> <DD.MM.YYYY>
std::string addBirthday(const Args& args, domain::model::Directory& directory);

/// show-birthday <name>
std::string showBirthday(const Args& args, const domain::model::Directory& directory);

/**
 * @brief birthdays
 * @param today Reference date for the window
 * @param windowDays Inclusive look-ahead in days
 */
std::string showUpcomingBirthdays(const domain::model::Directory& directory,
                                  const domain::model::CalendarDate& today,
                                  int windowDays);

} // namespace contactbook::application
