/**
 * @file test_calendar_date.cpp
 * @brief Unit tests for CalendarDate
 */

#include <gtest/gtest.h>
#include <pesel/core/calendar_date.h>
#include "exception/exceptions.h"

using namespace pesel::core;

// ============================================================================
// Construction
// ============================================================================

TEST(CalendarDateTest, Of_ValidDate) {
    auto date = CalendarDate::of(1999, 12, 31);
    EXPECT_EQ(date.year(), 1999);
    EXPECT_EQ(date.month(), 12);
    EXPECT_EQ(date.day(), 31);
}

TEST(CalendarDateTest, Of_RejectsImpossibleDayOfMonth) {
    EXPECT_THROW(CalendarDate::of(2021, 2, 29), common::InvalidDateException);
    EXPECT_THROW(CalendarDate::of(2021, 4, 31), common::InvalidDateException);
    EXPECT_THROW(CalendarDate::of(2021, 1, 0), common::InvalidDateException);
    EXPECT_THROW(CalendarDate::of(2021, 1, 32), common::InvalidDateException);
}

TEST(CalendarDateTest, Of_RejectsImpossibleMonth) {
    EXPECT_THROW(CalendarDate::of(2021, 0, 1), common::InvalidDateException);
    EXPECT_THROW(CalendarDate::of(2021, 13, 1), common::InvalidDateException);
}

TEST(CalendarDateTest, Of_ErrorCarriesCode) {
    try {
        CalendarDate::of(1900, 2, 29);
        FAIL() << "Expected InvalidDateException";
    } catch (const common::InvalidDateException& e) {
        EXPECT_EQ(e.getCode(), common::ErrorCode::INVALID_DATE);
        EXPECT_NE(e.getDetails().find("1900"), std::string::npos);
    }
}

TEST(CalendarDateTest, Of_YearOutsidePeselBoundsIsStillADate) {
    EXPECT_NO_THROW(CalendarDate::of(1799, 12, 31));
    EXPECT_NO_THROW(CalendarDate::of(2300, 1, 1));
}

// ============================================================================
// Leap Years
// ============================================================================

TEST(CalendarDateTest, LeapYearRules) {
    EXPECT_TRUE(isLeapYear(2000));
    EXPECT_TRUE(isLeapYear(2024));
    EXPECT_FALSE(isLeapYear(1900));
    EXPECT_FALSE(isLeapYear(2100));
    EXPECT_FALSE(isLeapYear(2023));
}

TEST(CalendarDateTest, DaysInMonth) {
    EXPECT_EQ(daysInMonth(2000, 2), 29);
    EXPECT_EQ(daysInMonth(1900, 2), 28);
    EXPECT_EQ(daysInMonth(2021, 4), 30);
    EXPECT_EQ(daysInMonth(2021, 12), 31);
    EXPECT_EQ(daysInMonth(2021, 13), 0);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(CalendarDateTest, Parse_Iso) {
    auto date = CalendarDate::parse("2020-02-29");
    EXPECT_EQ(date, CalendarDate::of(2020, 2, 29));
}

TEST(CalendarDateTest, Parse_RejectsMalformedText) {
    EXPECT_THROW(CalendarDate::parse("2020-2-29"), common::InvalidDateFormatException);
    EXPECT_THROW(CalendarDate::parse("2020/02/29"), common::InvalidDateFormatException);
    EXPECT_THROW(CalendarDate::parse("20a0-02-01"), common::InvalidDateFormatException);
    EXPECT_THROW(CalendarDate::parse(""), common::InvalidDateFormatException);
}

TEST(CalendarDateTest, Parse_RejectsImpossibleDate) {
    EXPECT_THROW(CalendarDate::parse("2021-02-29"), common::InvalidDateException);
}

TEST(CalendarDateTest, ToString_ZeroPadded) {
    EXPECT_EQ(CalendarDate::of(1800, 1, 5).toString(), "1800-01-05");
}

// ============================================================================
// Successor and Distance
// ============================================================================

TEST(CalendarDateTest, Next_WithinMonth) {
    EXPECT_EQ(CalendarDate::of(2021, 3, 14).next(), CalendarDate::of(2021, 3, 15));
}

TEST(CalendarDateTest, Next_MonthAndYearRollover) {
    EXPECT_EQ(CalendarDate::of(2021, 4, 30).next(), CalendarDate::of(2021, 5, 1));
    EXPECT_EQ(CalendarDate::of(1999, 12, 31).next(), CalendarDate::of(2000, 1, 1));
}

TEST(CalendarDateTest, Next_LeapDay) {
    EXPECT_EQ(CalendarDate::of(2000, 2, 28).next(), CalendarDate::of(2000, 2, 29));
    EXPECT_EQ(CalendarDate::of(2000, 2, 29).next(), CalendarDate::of(2000, 3, 1));
    EXPECT_EQ(CalendarDate::of(2100, 2, 28).next(), CalendarDate::of(2100, 3, 1));
}

TEST(CalendarDateTest, DayNumber_Epoch) {
    EXPECT_EQ(CalendarDate::of(1970, 1, 1).toDayNumber(), 0);
    EXPECT_EQ(CalendarDate::of(1969, 12, 31).toDayNumber(), -1);
}

TEST(CalendarDateTest, DaysBetween_Years) {
    EXPECT_EQ(daysBetween(CalendarDate::of(1999, 1, 1), CalendarDate::of(1999, 12, 31)), 364);
    EXPECT_EQ(daysBetween(CalendarDate::of(2000, 1, 1), CalendarDate::of(2000, 12, 31)), 365);
    EXPECT_EQ(daysBetween(CalendarDate::of(1800, 1, 1), CalendarDate::of(2299, 12, 31)),
              500 * 365 + 121 - 1);
}

TEST(CalendarDateTest, DaysBetween_AgreesWithSuccessor) {
    auto start = CalendarDate::of(1899, 11, 15);
    auto date = start;
    for (int i = 0; i < 500; i++) {
        date = date.next();
    }
    EXPECT_EQ(daysBetween(start, date), 500);
}

TEST(CalendarDateTest, Ordering) {
    auto a = CalendarDate::of(1999, 12, 31);
    auto b = CalendarDate::of(2000, 1, 1);
    EXPECT_LT(a, b);
    EXPECT_LE(a, a);
    EXPECT_GT(b, a);
    EXPECT_NE(a, b);
}
