/**
 * @file calendar_date.h
 * @brief Proleptic Gregorian calendar date value
 *
 * Immutable (year, month, day) triple. Construction validates the
 * day-of-month against the month length and never clamps.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace pesel::core {

/**
 * @brief Check if year is a Gregorian leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, 0 for a month outside 1-12
 */
int daysInMonth(int year, int month);

class CalendarDate {
private:
    int year_;
    int month_;
    int day_;

    CalendarDate(int year, int month, int day)
        : year_(year), month_(month), day_(day) {}

public:
    static constexpr int kMinSupportedYear = 1;
    static constexpr int kMaxSupportedYear = 9999;

    /**
     * @brief Create a validated date
     * @throws common::InvalidDateException for an impossible year, month or day
     */
    static CalendarDate of(int year, int month, int day);

    /**
     * @brief Parse "YYYY-MM-DD"
     * @throws common::InvalidDateFormatException on malformed text
     * @throws common::InvalidDateException on an impossible date
     */
    static CalendarDate parse(const std::string& text);

    /// @brief January 1 of a year
    static CalendarDate firstDayOfYear(int year) { return of(year, 1, 1); }

    /// @brief December 31 of a year
    static CalendarDate lastDayOfYear(int year) { return of(year, 12, 31); }

    int year() const noexcept { return year_; }
    int month() const noexcept { return month_; }
    int day() const noexcept { return day_; }

    /**
     * @brief Successor day (rolls over month and year)
     */
    CalendarDate next() const;

    /**
     * @brief Serial day number (days since 1970-01-01, negative before)
     */
    int64_t toDayNumber() const noexcept;

    /**
     * @brief Format as YYYY-MM-DD
     */
    std::string toString() const;

    bool operator==(const CalendarDate& other) const noexcept {
        return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }

    bool operator!=(const CalendarDate& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const CalendarDate& other) const noexcept {
        if (year_ != other.year_) return year_ < other.year_;
        if (month_ != other.month_) return month_ < other.month_;
        return day_ < other.day_;
    }

    bool operator<=(const CalendarDate& other) const noexcept {
        return !(other < *this);
    }

    bool operator>(const CalendarDate& other) const noexcept {
        return other < *this;
    }
};

/**
 * @brief Days from start to end (negative if end precedes start)
 */
int64_t daysBetween(const CalendarDate& start, const CalendarDate& end);

std::ostream& operator<<(std::ostream& os, const CalendarDate& date);

} // namespace pesel::core
