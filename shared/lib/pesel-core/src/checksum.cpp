/**
 * @file checksum.cpp
 * @brief PESEL check digit implementation
 */

#include "pesel/core/checksum.h"
#include "pesel/core/types.h"
#include "exception/exceptions.h"
#include <algorithm>
#include <array>
#include <cctype>

namespace pesel::core {

namespace {

constexpr std::array<int, kBaseLength> kWeights = {1, 3, 7, 9, 1, 3, 7, 9, 1, 3};

bool allDigits(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

int weightedCheckDigit(const std::string& digits) {
    int total = 0;
    for (size_t i = 0; i < kBaseLength; i++) {
        total += (digits[i] - '0') * kWeights[i];
    }
    return (10 - (total % 10)) % 10;
}

} // namespace

int calculateCheckDigit(const std::string& base) {
    if (base.size() != kBaseLength) {
        throw common::InvalidIdentifierFormatException(
            base, "expected " + std::to_string(kBaseLength) + " digits, got " +
                  std::to_string(base.size()));
    }
    if (!allDigits(base)) {
        throw common::InvalidIdentifierFormatException(base, "non-digit character");
    }
    return weightedCheckDigit(base);
}

void verifyChecksum(const std::string& text) {
    if (text.size() != kIdentifierLength) {
        throw common::InvalidIdentifierFormatException(
            text, "expected " + std::to_string(kIdentifierLength) + " digits, got " +
                  std::to_string(text.size()));
    }
    if (!allDigits(text)) {
        throw common::InvalidIdentifierFormatException(text, "non-digit character");
    }

    int expected = weightedCheckDigit(text);
    int actual = text[kBaseLength] - '0';
    if (expected != actual) {
        throw common::ChecksumMismatchException(text, expected, actual);
    }
}

bool isChecksumValid(const std::string& text) noexcept {
    if (text.size() != kIdentifierLength || !allDigits(text)) {
        return false;
    }
    return weightedCheckDigit(text) == text[kBaseLength] - '0';
}

} // namespace pesel::core
