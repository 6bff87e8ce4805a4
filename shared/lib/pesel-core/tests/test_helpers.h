/**
 * @file test_helpers.h
 * @brief Shared test helpers for pesel::core unit tests
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <pesel/core/pesel_identifier.h>
#include <pesel/core/progress.h>

namespace test_helpers {

/// Independent re-derivation of the weighted check digit over the first ten digits
inline int referenceCheckDigit(const std::string& digits) {
    static const int weights[10] = {1, 3, 7, 9, 1, 3, 7, 9, 1, 3};
    int sum = 0;
    for (int i = 0; i < 10; i++) {
        sum += (digits[i] - '0') * weights[i];
    }
    return (10 - sum % 10) % 10;
}

inline bool isElevenDigits(const std::string& s) {
    if (s.size() != 11) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

/// Two-digit month field (digits 3-4) of an identifier
inline std::string monthField(const pesel::core::PeselIdentifier& id) {
    return id.getValue().substr(2, 2);
}

/// Parity of digits 7-10
inline int blockParity(const std::string& s) {
    return std::stoi(s.substr(6, 4)) % 2;
}

/// Records every observer callback
class RecordingObserver : public pesel::core::IProgressObserver {
public:
    std::vector<pesel::core::ProgressUpdate> updates;
    std::vector<pesel::core::ProgressUpdate> completions;

    void onProgress(const pesel::core::ProgressUpdate& update) override {
        updates.push_back(update);
    }

    void onComplete(const pesel::core::ProgressUpdate& update) override {
        completions.push_back(update);
    }
};

} // namespace test_helpers
