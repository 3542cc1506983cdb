/**
 * @file test_calendar_date.cpp
 * @brief Unit tests for CalendarDate arithmetic
 */

#include <gtest/gtest.h>
#include <contactbook/domain/model/CalendarDate.hpp>

using contactbook::domain::model::CalendarDate;

namespace {

CalendarDate date(int year, int month, int day) {
    auto d = CalendarDate::of(year, month, day);
    EXPECT_TRUE(d.has_value()) << year << "-" << month << "-" << day;
    return *d;
}

} // namespace

class CalendarDateTest : public ::testing::Test {};

// ============================================================================
// Calendar rules
// ============================================================================

TEST_F(CalendarDateTest, IsLeapYear) {
    EXPECT_TRUE(CalendarDate::isLeapYear(2000));
    EXPECT_TRUE(CalendarDate::isLeapYear(2024));
    EXPECT_FALSE(CalendarDate::isLeapYear(1900));
    EXPECT_FALSE(CalendarDate::isLeapYear(2023));
    EXPECT_FALSE(CalendarDate::isLeapYear(2100));
}

TEST_F(CalendarDateTest, DaysInMonth) {
    EXPECT_EQ(CalendarDate::daysInMonth(2025, 1), 31);
    EXPECT_EQ(CalendarDate::daysInMonth(2025, 2), 28);
    EXPECT_EQ(CalendarDate::daysInMonth(2024, 2), 29);
    EXPECT_EQ(CalendarDate::daysInMonth(2025, 4), 30);
    EXPECT_EQ(CalendarDate::daysInMonth(2025, 0), 0);
    EXPECT_EQ(CalendarDate::daysInMonth(2025, 13), 0);
}

TEST_F(CalendarDateTest, Of_RejectsImpossibleDates) {
    EXPECT_FALSE(CalendarDate::of(2024, 2, 30).has_value());
    EXPECT_FALSE(CalendarDate::of(2023, 2, 29).has_value());
    EXPECT_FALSE(CalendarDate::of(2024, 4, 31).has_value());
    EXPECT_FALSE(CalendarDate::of(2024, 13, 1).has_value());
    EXPECT_FALSE(CalendarDate::of(2024, 1, 0).has_value());
    EXPECT_TRUE(CalendarDate::of(2024, 2, 29).has_value());
}

// ============================================================================
// Serial days and weekdays
// ============================================================================

TEST_F(CalendarDateTest, SerialDay_KnownValues) {
    EXPECT_EQ(date(1970, 1, 1).toSerialDay(), 0);
    EXPECT_EQ(date(1969, 12, 31).toSerialDay(), -1);
    EXPECT_EQ(date(2000, 1, 1).toSerialDay(), 10957);
    EXPECT_EQ(date(2024, 5, 17).toSerialDay(), 19860);
    EXPECT_EQ(date(1900, 3, 1).toSerialDay(), -25508);
    EXPECT_EQ(date(1600, 2, 29).toSerialDay(), -135081);
}

TEST_F(CalendarDateTest, FromSerialDay_InvertsToSerialDay) {
    for (long serial : {-135081L, -25508L, -1L, 0L, 59L, 10957L, 19860L, 2932896L}) {
        EXPECT_EQ(CalendarDate::fromSerialDay(serial).toSerialDay(), serial);
    }
    EXPECT_EQ(CalendarDate::fromSerialDay(19860), date(2024, 5, 17));
}

TEST_F(CalendarDateTest, Weekday_MondayIsZero) {
    EXPECT_EQ(date(1970, 1, 1).weekday(), 3);   // Thursday
    EXPECT_EQ(date(2000, 1, 1).weekday(), 5);   // Saturday
    EXPECT_EQ(date(2024, 5, 17).weekday(), 4);  // Friday
    EXPECT_EQ(date(2024, 5, 19).weekday(), CalendarDate::SUNDAY);
    EXPECT_EQ(date(2024, 5, 20).weekday(), CalendarDate::MONDAY);
    EXPECT_EQ(date(1600, 2, 29).weekday(), 1);  // Tuesday
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST_F(CalendarDateTest, PlusDays_CrossesMonthAndYear) {
    EXPECT_EQ(date(2024, 5, 18).plusDays(2), date(2024, 5, 20));
    EXPECT_EQ(date(2024, 2, 28).plusDays(1), date(2024, 2, 29));
    EXPECT_EQ(date(2023, 2, 28).plusDays(1), date(2023, 3, 1));
    EXPECT_EQ(date(2024, 12, 31).plusDays(1), date(2025, 1, 1));
    EXPECT_EQ(date(2025, 1, 1).plusDays(-1), date(2024, 12, 31));
}

TEST_F(CalendarDateTest, DaysUntil_IsSigned) {
    EXPECT_EQ(date(2024, 5, 17).daysUntil(date(2024, 5, 25)), 8);
    EXPECT_EQ(date(2024, 5, 25).daysUntil(date(2024, 5, 17)), -8);
    EXPECT_EQ(date(2024, 12, 28).daysUntil(date(2025, 1, 4)), 7);
}

TEST_F(CalendarDateTest, WithYear_KeepsMonthAndDay) {
    EXPECT_EQ(date(1990, 5, 20).withYear(2024), date(2024, 5, 20));
}

TEST_F(CalendarDateTest, WithYear_LeapDayInCommonYearBecomesFeb28) {
    EXPECT_EQ(date(2000, 2, 29).withYear(2025), date(2025, 2, 28));
    EXPECT_EQ(date(2000, 2, 29).withYear(2028), date(2028, 2, 29));
}

TEST_F(CalendarDateTest, Comparison) {
    EXPECT_LT(date(2024, 5, 17), date(2024, 5, 18));
    EXPECT_LT(date(2023, 12, 31), date(2024, 1, 1));
    EXPECT_GT(date(2024, 6, 1), date(2024, 5, 31));
    EXPECT_LE(date(2024, 5, 17), date(2024, 5, 17));
    EXPECT_NE(date(2024, 5, 17), date(2025, 5, 17));
}

TEST_F(CalendarDateTest, Format_ZeroPadded) {
    EXPECT_EQ(date(2024, 5, 7).format(), "07.05.2024");
    EXPECT_EQ(date(987, 12, 31).format(), "31.12.0987");
}

TEST_F(CalendarDateTest, Today_IsAValidDate) {
    auto today = CalendarDate::today();
    EXPECT_TRUE(CalendarDate::of(today.getYear(), today.getMonth(), today.getDay()).has_value());
}
