/**
 * @file error_codes.h
 * @brief Standardized error codes for the PESEL generator
 *
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Core generation errors (1000-1999)
    INVALID_YEAR_RANGE = 1001,
    INVALID_DATE = 1002,
    INVALID_DATE_FORMAT = 1003,

    // Verification errors (2000-2999)
    INVALID_IDENTIFIER_FORMAT = 2001,
    CHECKSUM_MISMATCH = 2002,

    // Output errors (3000-3999)
    OUTPUT_WRITE_FAILED = 3001,
    OUTPUT_DIRECTORY_FAILED = 3002,

    // Invocation errors (4000-4999)
    INVALID_ARGUMENT = 4001,
    CONFIG_INVALID = 4002,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        // Core
        case ErrorCode::INVALID_YEAR_RANGE: return "INVALID_YEAR_RANGE";
        case ErrorCode::INVALID_DATE: return "INVALID_DATE";
        case ErrorCode::INVALID_DATE_FORMAT: return "INVALID_DATE_FORMAT";

        // Verification
        case ErrorCode::INVALID_IDENTIFIER_FORMAT: return "INVALID_IDENTIFIER_FORMAT";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";

        // Output
        case ErrorCode::OUTPUT_WRITE_FAILED: return "OUTPUT_WRITE_FAILED";
        case ErrorCode::OUTPUT_DIRECTORY_FAILED: return "OUTPUT_DIRECTORY_FAILED";

        // Invocation
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to process exit status
 *
 * Output failures exit with 2, every other failure with 1.
 */
inline int errorCodeToExitStatus(ErrorCode code) {
    int numericCode = static_cast<int>(code);

    if (numericCode == 0) {
        return 0;
    } else if (numericCode >= 3000 && numericCode < 4000) {
        return 2;
    }

    return 1;
}

/**
 * @brief Error report builder (used for --json output)
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;
    std::string details_;

public:
    ErrorResponse(ErrorCode code, const std::string& message, const std::string& details = "")
        : code_(code), message_(message), details_(details) {}

    /**
     * @brief Convert to JSON
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["message"] = message_;

        if (!details_.empty()) {
            json["error"]["details"] = details_;
        }

        return json;
    }
};

} // namespace common
