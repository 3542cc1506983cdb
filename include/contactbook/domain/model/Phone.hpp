/**
 * @file Phone.hpp
 * @brief Value Object for a contact's phone number
 */

#pragma once

#include "contactbook/shared/domain/ValueObject.hpp"
#include "contactbook/shared/exception/DomainException.hpp"
#include <string>
#include <algorithm>
#include <cctype>

namespace contactbook::domain::model {

/**
 * @brief Phone number Value Object
 *
 * Exactly PHONE_LENGTH ASCII digits, stored verbatim.
 */
class Phone : public shared::domain::StringValueObject {
public:
    static constexpr size_t PHONE_LENGTH = 10;

    /**
     * @brief Create from raw input
     * @throws shared::exception::ValidationException on non-digit characters or wrong length
     */
    static Phone of(const std::string& value) {
        return Phone(value);
    }

private:
    explicit Phone(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        // An empty string is reported as non-digit, like any other non-numeric input
        bool allDigits = !value_.empty() && std::all_of(value_.begin(), value_.end(),
            [](unsigned char c) { return c >= '0' && c <= '9'; });
        if (!allDigits) {
            throw shared::exception::ValidationException(
                "PHONE_NOT_DIGITS",
                "Phone must contain only digits."
            );
        }

        if (length() != PHONE_LENGTH) {
            throw shared::exception::ValidationException(
                "PHONE_WRONG_LENGTH",
                "Phone must be exactly " + std::to_string(PHONE_LENGTH) + " digits."
            );
        }
    }
};

} // namespace contactbook::domain::model
