/**
 * @file Birthday.hpp
 * @brief Value Object for a contact's date of birth
 */

#pragma once

#include "contactbook/shared/domain/ValueObject.hpp"
#include "CalendarDate.hpp"
#include <string>

namespace contactbook::domain::model {

/**
 * @brief Birthday Value Object
 *
 * Parsed from the fixed DD.MM.YYYY format; always a real calendar date.
 */
class Birthday : public shared::domain::ValueObject<CalendarDate> {
public:
    static constexpr const char* DATE_FORMAT = "DD.MM.YYYY";

    /**
     * @brief Parse DD.MM.YYYY
     * @throws shared::exception::ValidationException (BAD_DATE_FORMAT) on a malformed
     *         string or a date that does not exist
     */
    static Birthday of(const std::string& value);

    /**
     * @brief Wrap an already valid date
     */
    static Birthday of(const CalendarDate& date) {
        return Birthday(date);
    }

    [[nodiscard]] const CalendarDate& getDate() const noexcept {
        return value_;
    }

    /**
     * @brief Render back to DD.MM.YYYY
     */
    [[nodiscard]] std::string format() const {
        return value_.format();
    }

private:
    explicit Birthday(const CalendarDate& date) : ValueObject<CalendarDate>(date) {}
};

} // namespace contactbook::domain::model
