/**
 * @file generation_service.cpp
 * @brief Generation Service implementation
 */

#include "generation_service.h"
#include <pesel/core/checksum.h>
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

Json::Value GenerationService::VerificationResult::toJson() const {
    Json::Value json;
    json["pesel"] = input;
    json["valid"] = valid;
    if (!valid) {
        json["errorCode"] = errorCode;
        json["error"] = error;
    }
    return json;
}

GenerationService::GenerationService(repositories::OutputRepository* outputRepo)
    : outputRepo_(outputRepo) {
    if (!outputRepo_) {
        throw std::invalid_argument("GenerationService: outputRepo cannot be nullptr");
    }
}

uint64_t GenerationService::streamRange(
    const pesel::core::RangeEnumerator& range,
    std::ostream& out,
    pesel::core::IProgressObserver* observer) {

    uint64_t count = range.run([&out](const pesel::core::PeselIdentifier& id) {
        out << id.getValue() << '\n';
    }, observer);

    out.flush();
    if (!out) {
        throw common::OutputException(
            common::ErrorCode::OUTPUT_WRITE_FAILED,
            "Failed while writing identifiers",
            "<stream>");
    }
    return count;
}

uint64_t GenerationService::writeRange(
    const pesel::core::RangeEnumerator& range,
    const std::string& path,
    pesel::core::IProgressObserver* observer) {

    spdlog::debug("Writing {} identifiers to {}", range.expectedCount(), path);

    return outputRepo_->writeAtomically(path, [this, &range, observer](std::ostream& out) {
        return streamRange(range, out, observer);
    });
}

std::vector<GenerationService::VerificationResult> GenerationService::verify(
    const std::vector<std::string>& inputs) const {

    std::vector<VerificationResult> results;
    results.reserve(inputs.size());

    for (const auto& input : inputs) {
        VerificationResult result;
        result.input = input;
        try {
            pesel::core::verifyChecksum(input);
            result.valid = true;
        } catch (const common::PeselException& e) {
            result.valid = false;
            result.errorCode = common::errorCodeToString(e.getCode());
            result.error = std::string(e.what()) + " (" + e.getDetails() + ")";
            spdlog::debug("Verification failed for '{}': {}", input, result.error);
        }
        results.push_back(std::move(result));
    }

    return results;
}

} // namespace services
