/**
 * @file types.h
 * @brief Common types and constants for the PESEL core library
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace pesel::core {

/// @brief Supported birth year bounds (century offsets exist for 1800-2299)
constexpr int kMinYear = 1800;
constexpr int kMaxYear = 2299;

/// @brief Sequential number bounds (digits 7-10)
constexpr int kMinSequentialNumber = 0;
constexpr int kMaxSequentialNumber = 9999;

/// @brief Identifier layout
constexpr size_t kDatePartLength = 6;
constexpr size_t kSequentialPartLength = 4;
constexpr size_t kBaseLength = kDatePartLength + kSequentialPartLength;
constexpr size_t kIdentifierLength = kBaseLength + 1;

/// @brief Sex encoded by the parity of the sequential block
enum class Sex {
    MALE,    ///< Odd sequential block
    FEMALE   ///< Even sequential block
};

/// @brief Optional sex restriction for range enumeration (nullopt = both)
using SexFilter = std::optional<Sex>;

/// @brief Sex implied by a sequential number (odd = male, even = female)
inline Sex sexForSequential(int sequentialNumber) {
    return (sequentialNumber % 2 != 0) ? Sex::MALE : Sex::FEMALE;
}

/// @brief Convert Sex to its lowercase name ("male" / "female")
inline std::string sexToString(Sex sex) {
    switch (sex) {
        case Sex::MALE:   return "male";
        case Sex::FEMALE: return "female";
    }
    return "unknown";
}

/// @brief Parse "male" / "female", nullopt for anything else
inline std::optional<Sex> sexFromString(const std::string& name) {
    if (name == "male") return Sex::MALE;
    if (name == "female") return Sex::FEMALE;
    return std::nullopt;
}

} // namespace pesel::core
