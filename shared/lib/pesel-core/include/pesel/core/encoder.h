/**
 * @file encoder.h
 * @brief PESEL encoder: (date, sequential number, sex) -> identifier
 *
 * Pure functions, no state, no I/O.
 *
 * Layout of the generated identifier:
 *   YY MM' DD  SSSS  C
 *   - YY   : year mod 100
 *   - MM'  : month + century offset (see centuryMonthOffset())
 *   - DD   : day of month
 *   - SSSS : sequential number, parity-corrected (odd = male, even = female)
 *   - C    : check digit (see checksum.h)
 */

#pragma once

#include "pesel/core/calendar_date.h"
#include "pesel/core/pesel_identifier.h"
#include "pesel/core/types.h"
#include <optional>
#include <string>

namespace pesel::core {

/**
 * @brief Month offset encoding the century of a birth year
 *
 *   1800-1899: +80
 *   1900-1999: +0
 *   2000-2099: +20
 *   2100-2199: +40
 *   2200-2299: +60
 *
 * Years outside 1800-2299 are not rejected here (range checks belong to
 * the caller) and get no offset.
 */
int centuryMonthOffset(int year) noexcept;

/**
 * @brief Format digits 1-6 (YYMMDD with century-encoded month)
 *
 * Example: 2020-01-05 -> "202105", 1800-01-01 -> "008101"
 */
std::string formatDateForPesel(const CalendarDate& date);

/**
 * @brief Clamp to [0, 9999] and correct parity for the requested sex
 *
 * A value with the wrong parity moves by one: +1 for male, -1 for female.
 * After clamping this never leaves [0, 9999] (9999 as female -> 9998,
 * 0 as male -> 1).
 */
int normalizeSequentialNumber(int sequentialNumber, Sex sex) noexcept;

/**
 * @brief Format digits 7-10 (normalized sequential number, 4 digits)
 */
std::string formatSequentialAndSex(int sequentialNumber, Sex sex);

/**
 * @brief Encode a complete 11-digit identifier
 *
 * Total over valid dates; the year is assumed to lie in 1800-2299.
 */
PeselIdentifier encode(const CalendarDate& date, int sequentialNumber, Sex sex);

/**
 * @brief Direct single-identifier generation
 *
 * @param date Birth date
 * @param sequentialNumber Sequential number override (default 0)
 * @param sex Requested sex; when omitted, the parity of the clamped
 *            sequential number decides
 */
PeselIdentifier generateSingle(
    const CalendarDate& date,
    std::optional<int> sequentialNumber = std::nullopt,
    std::optional<Sex> sex = std::nullopt);

} // namespace pesel::core
