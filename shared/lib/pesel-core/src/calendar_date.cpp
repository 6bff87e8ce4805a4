/**
 * @file calendar_date.cpp
 * @brief Proleptic Gregorian calendar date implementation
 */

#include "pesel/core/calendar_date.h"
#include "exception/exceptions.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace pesel::core {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int daysInMonth(int year, int month) {
    static const int kDaysInMonth[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDaysInMonth[month - 1];
}

CalendarDate CalendarDate::of(int year, int month, int day) {
    if (year < kMinSupportedYear || year > kMaxSupportedYear ||
        month < 1 || month > 12 ||
        day < 1 || day > daysInMonth(year, month)) {
        throw common::InvalidDateException(year, month, day);
    }
    return CalendarDate(year, month, day);
}

CalendarDate CalendarDate::parse(const std::string& text) {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw common::InvalidDateFormatException(text);
    }
    for (size_t i = 0; i < text.size(); i++) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw common::InvalidDateFormatException(text);
        }
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));

    return of(year, month, day);
}

CalendarDate CalendarDate::next() const {
    if (day_ < daysInMonth(year_, month_)) {
        return CalendarDate(year_, month_, day_ + 1);
    }
    if (month_ < 12) {
        return CalendarDate(year_, month_ + 1, 1);
    }
    if (year_ >= kMaxSupportedYear) {
        throw common::InvalidDateException(year_ + 1, 1, 1);
    }
    return CalendarDate(year_ + 1, 1, 1);
}

int64_t CalendarDate::toDayNumber() const noexcept {
    // Era-based civil-to-days conversion (400-year cycles of 146097 days)
    int64_t y = year_ - (month_ <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month_ + 9) % 12;  // March = 0
    const int64_t doy = (153 * mp + 2) / 5 + day_ - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string CalendarDate::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year_ << '-'
        << std::setw(2) << month_ << '-'
        << std::setw(2) << day_;
    return oss.str();
}

int64_t daysBetween(const CalendarDate& start, const CalendarDate& end) {
    return end.toDayNumber() - start.toDayNumber();
}

std::ostream& operator<<(std::ostream& os, const CalendarDate& date) {
    return os << date.toString();
}

} // namespace pesel::core
