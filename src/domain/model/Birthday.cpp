/**
 * @file Birthday.cpp
 * @brief DD.MM.YYYY parsing for the Birthday value object
 */

#include "contactbook/domain/model/Birthday.hpp"
#include "contactbook/shared/exception/DomainException.hpp"

namespace contactbook::domain::model {

namespace {

[[noreturn]] void throwBadFormat() {
    throw shared::exception::ValidationException(
        "BAD_DATE_FORMAT",
        std::string("Invalid date format. Use ") + Birthday::DATE_FORMAT
    );
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

int digitsToInt(const std::string& s, size_t pos, size_t count) {
    int result = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        result = result * 10 + (s[i] - '0');
    }
    return result;
}

} // namespace

Birthday Birthday::of(const std::string& value) {
    // DD.MM.YYYY
    if (value.size() != 10 || value[2] != '.' || value[5] != '.') {
        throwBadFormat();
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 2 || i == 5) continue;
        if (!isDigit(value[i])) {
            throwBadFormat();
        }
    }

    int day = digitsToInt(value, 0, 2);
    int month = digitsToInt(value, 3, 2);
    int year = digitsToInt(value, 6, 4);
    if (year < 1) {
        throwBadFormat();
    }

    auto date = CalendarDate::of(year, month, day);
    if (!date) {
        throwBadFormat();
    }
    return Birthday(*date);
}

} // namespace contactbook::domain::model
