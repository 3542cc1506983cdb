/**
 * @file ContactName.hpp
 * @brief Value Object for a contact's name (the directory key)
 */

#pragma once

#include "contactbook/shared/domain/ValueObject.hpp"
#include "contactbook/shared/exception/DomainException.hpp"
#include <string>

namespace contactbook::domain::model {

/**
 * @brief Contact name Value Object
 *
 * Any non-empty string. Matching is exact (case-sensitive, no trimming).
 */
class ContactName : public shared::domain::StringValueObject {
public:
    static ContactName of(const std::string& value) {
        return ContactName(value);
    }

private:
    explicit ContactName(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty()) {
            throw shared::exception::ValidationException(
                "EMPTY_NAME",
                "Contact name cannot be empty."
            );
        }
    }
};

} // namespace contactbook::domain::model
