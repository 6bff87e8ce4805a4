#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <json/json.h>
#include <pesel/core/range_enumerator.h>
#include "../repositories/output_repository.h"

/**
 * @file generation_service.h
 * @brief Generation Service - range output and identifier verification
 *
 * Responsibilities:
 * - Stream a range to an output stream (one identifier per line)
 * - Write a range to a file (atomic, via OutputRepository)
 * - Verify supplied identifiers against their check digit
 *
 * Does NOT handle:
 * - Argument parsing, prompts (main's job)
 * - Per-year partitioning (BatchService's job)
 */

namespace services {

class GenerationService {
public:
    /**
     * @brief Verification outcome for one supplied string
     */
    struct VerificationResult {
        std::string input;
        bool valid = false;
        std::string errorCode;   ///< Empty when valid
        std::string error;       ///< Empty when valid

        Json::Value toJson() const;
    };

    /**
     * @param outputRepo Output repository (non-owning pointer)
     * @throws std::invalid_argument if outputRepo is nullptr
     */
    explicit GenerationService(repositories::OutputRepository* outputRepo);

    /**
     * @brief Write every identifier of the range to out, newline terminated
     * @return Number of identifiers written
     */
    uint64_t streamRange(
        const pesel::core::RangeEnumerator& range,
        std::ostream& out,
        pesel::core::IProgressObserver* observer = nullptr);

    /**
     * @brief Write the range to a file through OutputRepository::writeAtomically()
     * @throws common::OutputException on I/O failure (no partial file remains)
     */
    uint64_t writeRange(
        const pesel::core::RangeEnumerator& range,
        const std::string& path,
        pesel::core::IProgressObserver* observer = nullptr);

    /**
     * @brief Verify the check digit of each input
     */
    std::vector<VerificationResult> verify(const std::vector<std::string>& inputs) const;

private:
    repositories::OutputRepository* outputRepo_;
};

} // namespace services
