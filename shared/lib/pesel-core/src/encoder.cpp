/**
 * @file encoder.cpp
 * @brief PESEL encoder implementation
 */

#include "pesel/core/encoder.h"
#include <algorithm>

namespace pesel::core {

namespace {

// Fixed-width zero-padded decimal, value must be non-negative
void appendPadded(std::string& out, int value, int width) {
    char buffer[8];
    for (int i = width - 1; i >= 0; i--) {
        buffer[i] = static_cast<char>('0' + value % 10);
        value /= 10;
    }
    out.append(buffer, static_cast<size_t>(width));
}

} // namespace

int centuryMonthOffset(int year) noexcept {
    if (year >= 1800 && year <= 1899) return 80;
    if (year >= 2000 && year <= 2099) return 20;
    if (year >= 2100 && year <= 2199) return 40;
    if (year >= 2200 && year <= 2299) return 60;
    return 0;
}

std::string formatDateForPesel(const CalendarDate& date) {
    std::string out;
    out.reserve(kDatePartLength);
    appendPadded(out, date.year() % 100, 2);
    appendPadded(out, date.month() + centuryMonthOffset(date.year()), 2);
    appendPadded(out, date.day(), 2);
    return out;
}

int normalizeSequentialNumber(int sequentialNumber, Sex sex) noexcept {
    int value = std::clamp(sequentialNumber, kMinSequentialNumber, kMaxSequentialNumber);

    bool isOdd = (value % 2 == 1);
    bool isMale = (sex == Sex::MALE);
    if (isMale != isOdd) {
        value += isMale ? 1 : -1;
    }
    return value;
}

std::string formatSequentialAndSex(int sequentialNumber, Sex sex) {
    std::string out;
    out.reserve(kSequentialPartLength);
    appendPadded(out, normalizeSequentialNumber(sequentialNumber, sex), 4);
    return out;
}

PeselIdentifier encode(const CalendarDate& date, int sequentialNumber, Sex sex) {
    return PeselIdentifier::fromParts(formatDateForPesel(date),
                                      formatSequentialAndSex(sequentialNumber, sex));
}

PeselIdentifier generateSingle(
    const CalendarDate& date,
    std::optional<int> sequentialNumber,
    std::optional<Sex> sex) {
    int seq = std::clamp(sequentialNumber.value_or(0), kMinSequentialNumber, kMaxSequentialNumber);
    return encode(date, seq, sex.value_or(sexForSequential(seq)));
}

} // namespace pesel::core
