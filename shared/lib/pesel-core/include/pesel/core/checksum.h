/**
 * @file checksum.h
 * @brief PESEL check digit calculation and verification
 *
 * Pure functions, no I/O.
 * Weights [1,3,7,9,1,3,7,9,1,3] are applied to the first ten digits;
 * check digit = (10 - (sum mod 10)) mod 10.
 */

#pragma once

#include <string>

namespace pesel::core {

/**
 * @brief Calculate the check digit for a 10-digit base
 *
 * @param base Exactly ten ASCII digits (date part + sequential part)
 * @return Check digit 0-9
 * @throws common::InvalidIdentifierFormatException if base is not ten digits
 */
int calculateCheckDigit(const std::string& base);

/**
 * @brief Verify the trailing check digit of an 11-digit identifier
 *
 * Only the structure needed to re-derive the checksum is validated
 * (exactly eleven ASCII digits). The date part is not interpreted.
 *
 * @throws common::InvalidIdentifierFormatException if text is not eleven digits
 * @throws common::ChecksumMismatchException if the check digit disagrees
 */
void verifyChecksum(const std::string& text);

/**
 * @brief Non-throwing variant of verifyChecksum()
 */
bool isChecksumValid(const std::string& text) noexcept;

} // namespace pesel::core
