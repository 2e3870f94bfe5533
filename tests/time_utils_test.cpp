// time_utils_test.cpp - Tests for calendar-date and clock-time helpers
//
// Covers ISO date parsing/formatting, weekday keys, calendar-aware month and
// year arithmetic, and HH:MM clock parsing.

#include <gtest/gtest.h>

#include "time_utils.hpp"

#include <stdexcept>
#include <string>

using time_utils::make_date;

// ===========================================================================
// ISO dates
// ===========================================================================
class IsoDateTest : public ::testing::Test {};

TEST_F(IsoDateTest, ParsesPaddedDate) {
    auto d = time_utils::parse_iso_date("2026-01-20");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, make_date(2026, 1, 20));
}

TEST_F(IsoDateTest, ParsesUnpaddedMonthAndDay) {
    auto d = time_utils::parse_iso_date("2026-2-5");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, make_date(2026, 2, 5));
}

TEST_F(IsoDateTest, RejectsImpossibleDates) {
    EXPECT_FALSE(time_utils::parse_iso_date("2026-02-30").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("2026-13-01").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("2025-02-29").has_value());
}

TEST_F(IsoDateTest, AcceptsLeapDay) {
    EXPECT_TRUE(time_utils::parse_iso_date("2024-02-29").has_value());
}

TEST_F(IsoDateTest, RejectsMalformedText) {
    EXPECT_FALSE(time_utils::parse_iso_date("").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("20260120").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("2026/01/20").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("2026-01-20x").has_value());
    EXPECT_FALSE(time_utils::parse_iso_date("26-01-20").has_value());
}

TEST_F(IsoDateTest, FormatIsZeroPadded) {
    EXPECT_EQ(time_utils::format_date(make_date(2026, 3, 7)), "2026-03-07");
    EXPECT_EQ(time_utils::format_compact_date(make_date(2026, 3, 7)), "20260307");
}

// ===========================================================================
// Weekdays
// ===========================================================================
class WeekdayTest : public ::testing::Test {};

TEST_F(WeekdayTest, KnownWeekdays) {
    EXPECT_EQ(time_utils::weekday_key(make_date(2026, 1, 5)), "monday");
    EXPECT_EQ(time_utils::weekday_key(make_date(2026, 1, 6)), "tuesday");
    EXPECT_EQ(time_utils::weekday_key(make_date(2026, 1, 11)), "sunday");
    EXPECT_EQ(time_utils::weekday_name(make_date(2026, 1, 9)), "Friday");
    EXPECT_EQ(time_utils::weekday_abbrev(make_date(2026, 1, 10)), "Sat");
}

TEST_F(WeekdayTest, WeekdayKeyValidation) {
    EXPECT_TRUE(time_utils::is_weekday_key("wednesday"));
    EXPECT_FALSE(time_utils::is_weekday_key("Wednesday"));
    EXPECT_FALSE(time_utils::is_weekday_key("wed"));
}

// ===========================================================================
// Calendar arithmetic
// ===========================================================================
class CalendarArithmeticTest : public ::testing::Test {};

TEST_F(CalendarArithmeticTest, AddMonthsKeepsDayOfMonth) {
    EXPECT_EQ(time_utils::add_months(make_date(2026, 1, 15), 1), make_date(2026, 2, 15));
    EXPECT_EQ(time_utils::add_months(make_date(2026, 11, 1), 3), make_date(2027, 2, 1));
}

TEST_F(CalendarArithmeticTest, AddMonthsClampsToMonthEnd) {
    EXPECT_EQ(time_utils::add_months(make_date(2026, 1, 31), 1), make_date(2026, 2, 28));
    EXPECT_EQ(time_utils::add_months(make_date(2024, 1, 31), 1), make_date(2024, 2, 29));
    EXPECT_EQ(time_utils::add_months(make_date(2026, 3, 31), 1), make_date(2026, 4, 30));
}

TEST_F(CalendarArithmeticTest, AddYearsFromLeapDay) {
    EXPECT_EQ(time_utils::add_years(make_date(2024, 2, 29), 1), make_date(2025, 2, 28));
    EXPECT_EQ(time_utils::add_years(make_date(2024, 2, 29), 4), make_date(2028, 2, 29));
}

TEST_F(CalendarArithmeticTest, DaysBetween) {
    EXPECT_EQ(time_utils::days_between(make_date(2026, 1, 1), make_date(2026, 4, 1)), 90);
    EXPECT_EQ(time_utils::days_between(make_date(2026, 1, 5), make_date(2026, 1, 5)), 0);
}

TEST_F(CalendarArithmeticTest, LastRepresentableYear) {
    EXPECT_EQ(time_utils::add_months(make_date(2026, 1, 1), (9999 - 2026) * 12 + 11),
              make_date(9999, 12, 1));
    EXPECT_EQ(time_utils::add_days(make_date(9999, 12, 30), 1), make_date(9999, 12, 31));
}

TEST_F(CalendarArithmeticTest, YearsPast9999Throw) {
    EXPECT_THROW(time_utils::add_months(make_date(2026, 1, 1), 999999), std::out_of_range);
    EXPECT_THROW(time_utils::add_years(make_date(2026, 1, 1), 40000), std::out_of_range);
    EXPECT_THROW(time_utils::add_days(make_date(9999, 12, 31), 1), std::out_of_range);
    EXPECT_THROW(time_utils::add_months(make_date(2026, 1, 1), 2000000000), std::out_of_range);
}

TEST_F(CalendarArithmeticTest, YearsBeforeOneThrow) {
    EXPECT_THROW(time_utils::add_months(make_date(1, 1, 1), -1), std::out_of_range);
    EXPECT_THROW(time_utils::add_days(make_date(1, 1, 1), -1), std::out_of_range);
    EXPECT_EQ(time_utils::add_months(make_date(1, 3, 31), -1), make_date(1, 2, 28));
}

TEST_F(CalendarArithmeticTest, OutOfRangeMessageNamesYear) {
    try {
        time_utils::add_months(make_date(2026, 1, 1), 999999);
        FAIL() << "expected std::out_of_range";
    } catch (const std::out_of_range& e) {
        EXPECT_STREQ(e.what(), "year 85359 is out of range");
    }
}

// ===========================================================================
// Clock times
// ===========================================================================
class ClockTimeTest : public ::testing::Test {};

TEST_F(ClockTimeTest, ParsesMinutes) {
    EXPECT_EQ(time_utils::parse_clock_minutes("08:00"), 480);
    EXPECT_EQ(time_utils::parse_clock_minutes("10:30"), 630);
    EXPECT_EQ(time_utils::parse_clock_minutes("00:00"), 0);
    EXPECT_EQ(time_utils::parse_clock_minutes("24:00"), 1440);
}

TEST_F(ClockTimeTest, RejectsMalformed) {
    EXPECT_FALSE(time_utils::parse_clock_minutes("8:00").has_value());
    EXPECT_FALSE(time_utils::parse_clock_minutes("08:60").has_value());
    EXPECT_FALSE(time_utils::parse_clock_minutes("25:00").has_value());
    EXPECT_FALSE(time_utils::parse_clock_minutes("24:30").has_value());
    EXPECT_FALSE(time_utils::parse_clock_minutes("ab:cd").has_value());
}

TEST_F(ClockTimeTest, TimeToHoursIsContinuous) {
    EXPECT_DOUBLE_EQ(time_utils::time_to_hours("10:30"), 10.5);
    EXPECT_DOUBLE_EQ(time_utils::time_to_hours("13:15"), 13.25);
    EXPECT_DOUBLE_EQ(time_utils::time_to_hours("00:00"), 0.0);
}
