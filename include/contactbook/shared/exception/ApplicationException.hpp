/**
 * @file ApplicationException.hpp
 * @brief Application layer exception class
 */

#pragma once

#include <stdexcept>
#include <string>

namespace contactbook::shared::exception {

/**
 * @brief Exception for application layer errors
 *
 * Raised by command handlers for malformed commands (e.g. missing arguments).
 */
class ApplicationException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Application Exception
     * @param code Error code (e.g., "MISSING_ARGUMENT")
     * @param message Human-readable error message
     */
    ApplicationException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

} // namespace contactbook::shared::exception
