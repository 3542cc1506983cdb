/**
 * @file CalendarDate.hpp
 * @brief Proleptic Gregorian calendar date with day arithmetic
 */

#pragma once

#include <string>
#include <optional>

namespace contactbook::domain::model {

/**
 * @brief A calendar date (year/month/day) without time of day
 *
 * Arithmetic goes through a serial day number (days since 1970-01-01),
 * so adding days and computing differences never touches the C time API.
 */
class CalendarDate {
public:
    static constexpr int MONDAY = 0;
    static constexpr int SATURDAY = 5;
    static constexpr int SUNDAY = 6;
    static constexpr int DAYS_IN_WEEK = 7;

    /**
     * @brief Create a date, checking the calendar
     * @return The date, or std::nullopt if it does not exist (e.g. 30.02)
     */
    static std::optional<CalendarDate> of(int year, int month, int day);

    /**
     * @brief Build a date from a serial day number
     * @param serialDay Days since 1970-01-01 (can be negative)
     */
    static CalendarDate fromSerialDay(long serialDay);

    /**
     * @brief Current local date from the system clock
     */
    static CalendarDate today();

    static bool isLeapYear(int year) noexcept;

    /**
     * @brief Number of days in month
     * @return 28..31, or 0 for a month outside 1..12
     */
    static int daysInMonth(int year, int month) noexcept;

    [[nodiscard]] int getYear() const noexcept { return year_; }
    [[nodiscard]] int getMonth() const noexcept { return month_; }
    [[nodiscard]] int getDay() const noexcept { return day_; }

    [[nodiscard]] long toSerialDay() const noexcept;

    /**
     * @brief Day of week, 0 = Monday .. 6 = Sunday
     */
    [[nodiscard]] int weekday() const noexcept;

    [[nodiscard]] CalendarDate plusDays(long days) const;

    /**
     * @brief Signed number of days from this date to other
     */
    [[nodiscard]] long daysUntil(const CalendarDate& other) const noexcept;

    /**
     * @brief Same month and day in another year
     *
     * 29 February becomes 28 February when the target year is not a leap year.
     */
    [[nodiscard]] CalendarDate withYear(int year) const;

    /**
     * @brief Render as DD.MM.YYYY
     */
    [[nodiscard]] std::string format() const;

    bool operator==(const CalendarDate& other) const noexcept;
    bool operator!=(const CalendarDate& other) const noexcept;
    bool operator<(const CalendarDate& other) const noexcept;
    bool operator<=(const CalendarDate& other) const noexcept;
    bool operator>(const CalendarDate& other) const noexcept;
    bool operator>=(const CalendarDate& other) const noexcept;

private:
    int year_;
    int month_;
    int day_;

    CalendarDate(int year, int month, int day) noexcept
        : year_(year), month_(month), day_(day) {}
};

} // namespace contactbook::domain::model
