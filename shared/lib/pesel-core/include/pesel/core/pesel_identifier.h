/**
 * @file pesel_identifier.h
 * @brief PESEL identifier value object
 *
 * Exactly eleven ASCII digits: DATE(6) SEQ+SEX(4) CHECK(1).
 * Every instance carries a valid check digit; instances are immutable.
 */

#pragma once

#include "pesel/core/types.h"
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace pesel::core {

class PeselIdentifier {
private:
    std::string value_;

    explicit PeselIdentifier(std::string value) : value_(std::move(value)) {}

public:
    /**
     * @brief Build from a 6-digit date part and a 4-digit sequential part
     *
     * The check digit is derived, never supplied.
     *
     * @throws common::InvalidIdentifierFormatException if the parts are malformed
     */
    static PeselIdentifier fromParts(const std::string& datePart, const std::string& sequentialPart);

    /**
     * @brief Build from an existing 11-digit string
     *
     * @throws common::InvalidIdentifierFormatException if not eleven digits
     * @throws common::ChecksumMismatchException if the check digit is wrong
     */
    static PeselIdentifier fromString(const std::string& text);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_;
    }

    /// @brief Digits 1-6 (YYMMDD with century-encoded month)
    std::string datePart() const {
        return value_.substr(0, kDatePartLength);
    }

    /// @brief Numeric value of digits 7-10
    int sequentialBlock() const;

    /// @brief Digit 11
    int checkDigit() const noexcept {
        return value_[kBaseLength] - '0';
    }

    /// @brief Sex encoded by the parity of the sequential block
    Sex sex() const {
        return sexForSequential(sequentialBlock());
    }

    bool operator==(const PeselIdentifier& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const PeselIdentifier& other) const {
        return !(*this == other);
    }

    bool operator<(const PeselIdentifier& other) const {
        return value_ < other.value_;
    }
};

std::ostream& operator<<(std::ostream& os, const PeselIdentifier& id);

} // namespace pesel::core

namespace std {
    template<>
    struct hash<pesel::core::PeselIdentifier> {
        size_t operator()(const pesel::core::PeselIdentifier& id) const {
            return hash<string>{}(id.getValue());
        }
    };
}
