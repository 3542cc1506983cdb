/**
 * @file CommandParser.hpp
 * @brief Tokenizes one line of user input
 */

#pragma once

#include <string>
#include <vector>

namespace contactbook::application {

using Args = std::vector<std::string>;

/**
 * @brief A command name and its raw arguments
 */
struct ParsedCommand {
    std::string command;    ///< Lower-cased; empty for a blank line
    Args args;              ///< Passed through unchanged

    [[nodiscard]] bool isEmpty() const noexcept {
        return command.empty();
    }
};

/**
 * @brief Split a line on whitespace; lower-case the first token only
 */
ParsedCommand parseInput(const std::string& line);

} // namespace contactbook::application
