/**
 * @file CalendarDate.cpp
 * @brief Calendar arithmetic implementation
 *
 * Serial day conversion follows the civil-from-days / days-from-civil
 * formulation over 400-year eras, valid for the whole int year range.
 */

#include "contactbook/domain/model/CalendarDate.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace contactbook::domain::model {

namespace {

constexpr long DAYS_PER_ERA = 146097;       // 400 Gregorian years
constexpr long EPOCH_SHIFT = 719468;        // 0000-03-01 -> 1970-01-01
constexpr int EPOCH_WEEKDAY = 3;            // 1970-01-01 was a Thursday

} // namespace

std::optional<CalendarDate> CalendarDate::of(int year, int month, int day) {
    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

CalendarDate CalendarDate::fromSerialDay(long serialDay) {
    long z = serialDay + EPOCH_SHIFT;
    const long era = (z >= 0 ? z : z - (DAYS_PER_ERA - 1)) / DAYS_PER_ERA;
    const long doe = z - era * DAYS_PER_ERA;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    const int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const long year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CalendarDate(static_cast<int>(year), month, day);
}

CalendarDate CalendarDate::today() {
    std::time_t now = std::time(nullptr);
    struct tm local;
    if (!localtime_r(&now, &local)) {
        throw std::runtime_error("Failed to read the local date");
    }
    return CalendarDate(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

bool CalendarDate::isLeapYear(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int year, int month) noexcept {
    switch (month) {
        case 1: case 3: case 5: case 7: case 8: case 10: case 12:
            return 31;
        case 4: case 6: case 9: case 11:
            return 30;
        case 2:
            return isLeapYear(year) ? 29 : 28;
        default:
            return 0;
    }
}

long CalendarDate::toSerialDay() const noexcept {
    const long y = static_cast<long>(year_) - (month_ <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (month_ > 2 ? month_ - 3 : month_ + 9) + 2) / 5 + day_ - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * DAYS_PER_ERA + doe - EPOCH_SHIFT;
}

int CalendarDate::weekday() const noexcept {
    const long serial = toSerialDay();
    return static_cast<int>(((serial % DAYS_IN_WEEK) + DAYS_IN_WEEK + EPOCH_WEEKDAY) % DAYS_IN_WEEK);
}

CalendarDate CalendarDate::plusDays(long days) const {
    return fromSerialDay(toSerialDay() + days);
}

long CalendarDate::daysUntil(const CalendarDate& other) const noexcept {
    return other.toSerialDay() - toSerialDay();
}

CalendarDate CalendarDate::withYear(int year) const {
    if (month_ == 2 && day_ == 29 && !isLeapYear(year)) {
        return CalendarDate(year, 2, 28);
    }
    return CalendarDate(year, month_, day_);
}

std::string CalendarDate::format() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << day_ << '.'
        << std::setw(2) << month_ << '.'
        << std::setw(4) << year_;
    return oss.str();
}

bool CalendarDate::operator==(const CalendarDate& other) const noexcept {
    return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
}

bool CalendarDate::operator!=(const CalendarDate& other) const noexcept {
    return !(*this == other);
}

bool CalendarDate::operator<(const CalendarDate& other) const noexcept {
    if (year_ != other.year_) return year_ < other.year_;
    if (month_ != other.month_) return month_ < other.month_;
    return day_ < other.day_;
}

bool CalendarDate::operator<=(const CalendarDate& other) const noexcept {
    return !(other < *this);
}

bool CalendarDate::operator>(const CalendarDate& other) const noexcept {
    return other < *this;
}

bool CalendarDate::operator>=(const CalendarDate& other) const noexcept {
    return !(*this < other);
}

} // namespace contactbook::domain::model
