/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Small helpers used by the command layer to tokenize and render input.
 */

#pragma once

#include <string>
#include <vector>

namespace contactbook {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split on runs of whitespace
 *
 * Leading/trailing whitespace is ignored, so "  a  b " gives ["a", "b"]
 * and a blank string gives an empty vector.
 *
 * @param str Input string
 * @return Non-empty tokens
 */
std::vector<std::string> splitWhitespace(const std::string& str);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace utils
} // namespace contactbook
