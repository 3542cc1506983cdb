/**
 * @file DomainException.hpp
 * @brief Domain layer exception classes
 */

#pragma once

#include <stdexcept>
#include <string>

namespace contactbook::shared::exception {

/**
 * @brief Exception for domain layer errors
 *
 * Used when a value does not meet its format contract or an aggregate
 * invariant would be broken. The message is meant for the end user.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "PHONE_WRONG_LENGTH")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
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

/**
 * @brief A field value failed validation at construction time
 */
class ValidationException : public DomainException {
public:
    ValidationException(std::string code, std::string message)
        : DomainException(std::move(code), std::move(message)) {}
};

/**
 * @brief The phone number is already present on the record
 */
class DuplicatePhoneException : public DomainException {
public:
    DuplicatePhoneException()
        : DomainException("DUPLICATE_PHONE", "This phone is already added.") {}
};

} // namespace contactbook::shared::exception
