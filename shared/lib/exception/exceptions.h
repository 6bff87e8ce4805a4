/**
 * @file exceptions.h
 * @brief Exception hierarchy for the PESEL generator
 *
 * Typed exceptions carrying an ErrorCode, shared by the core library and
 * the command line tool.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "error_codes.h"

namespace common {

/**
 * @brief Base exception for all PESEL generator errors
 */
class PeselException : public std::runtime_error {
private:
    ErrorCode code_;
    std::string details_;

public:
    explicit PeselException(
        ErrorCode code,
        const std::string& message,
        const std::string& details = "")
        : std::runtime_error(message)
        , code_(code)
        , details_(details) {}

    /**
     * @brief Get error code
     */
    ErrorCode getCode() const {
        return code_;
    }

    /**
     * @brief Get error details
     */
    const std::string& getDetails() const {
        return details_;
    }

    /**
     * @brief Convert to ErrorResponse
     */
    ErrorResponse toErrorResponse() const {
        return ErrorResponse(code_, what(), details_);
    }

    Json::Value toJson() const {
        return toErrorResponse().toJson();
    }
};

// =============================================================================
// Core Generation Exceptions
// =============================================================================

/**
 * @brief Year bounds outside 1800-2299, or start after end
 */
class InvalidYearRangeException : public PeselException {
public:
    explicit InvalidYearRangeException(const std::string& message, const std::string& details = "")
        : PeselException(ErrorCode::INVALID_YEAR_RANGE, message, details) {}
};

/**
 * @brief Impossible calendar date (month or day-of-month)
 */
class InvalidDateException : public PeselException {
public:
    InvalidDateException(int year, int month, int day)
        : PeselException(
            ErrorCode::INVALID_DATE,
            "Invalid calendar date",
            "Year: " + std::to_string(year) +
            ", Month: " + std::to_string(month) +
            ", Day: " + std::to_string(day)) {}
};

class InvalidDateFormatException : public PeselException {
public:
    explicit InvalidDateFormatException(const std::string& text)
        : PeselException(
            ErrorCode::INVALID_DATE_FORMAT,
            "Wrong date format, expected YYYY-MM-DD",
            "Input: " + text) {}
};

// =============================================================================
// Verification Exceptions
// =============================================================================

class InvalidIdentifierFormatException : public PeselException {
public:
    InvalidIdentifierFormatException(const std::string& input, const std::string& reason)
        : PeselException(
            ErrorCode::INVALID_IDENTIFIER_FORMAT,
            "Invalid identifier format",
            "Input: " + input + ", Reason: " + reason) {}
};

class ChecksumMismatchException : public PeselException {
public:
    ChecksumMismatchException(const std::string& input, int expected, int actual)
        : PeselException(
            ErrorCode::CHECKSUM_MISMATCH,
            "Checksum mismatch",
            "Input: " + input +
            ", Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual)) {}
};

// =============================================================================
// Output Exceptions
// =============================================================================

class OutputException : public PeselException {
public:
    explicit OutputException(
        ErrorCode code,
        const std::string& message,
        const std::string& path)
        : PeselException(code, message, "Path: " + path) {}
};

// =============================================================================
// Invocation Exceptions
// =============================================================================

class InvalidArgumentException : public PeselException {
public:
    explicit InvalidArgumentException(const std::string& message, const std::string& details = "")
        : PeselException(ErrorCode::INVALID_ARGUMENT, message, details) {}
};

class ConfigException : public PeselException {
public:
    explicit ConfigException(const std::string& key, const std::string& reason)
        : PeselException(
            ErrorCode::CONFIG_INVALID,
            "Configuration error",
            "Key: " + key + ", Reason: " + reason) {}
};

} // namespace common
