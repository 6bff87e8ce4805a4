/**
 * @file batch_service.cpp
 * @brief Batch Service implementation
 */

#include "batch_service.h"
#include "../common/progress_bar.h"
#include "exception/exceptions.h"
#include <pesel/core/range_enumerator.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace services {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;
constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

} // anonymous namespace

std::string partitionStatusToString(PartitionStatus status) {
    switch (status) {
        case PartitionStatus::GENERATED: return "GENERATED";
        case PartitionStatus::SKIPPED: return "SKIPPED";
        case PartitionStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// Summary types
// =============================================================================

Json::Value PartitionResult::toJson() const {
    Json::Value json;
    json["year"] = year;
    json["sex"] = pesel::core::sexToString(sex);
    json["file"] = path;
    json["status"] = partitionStatusToString(status);
    json["identifiers"] = Json::UInt64(identifiers);
    json["sizeBytes"] = Json::Int64(sizeBytes);
    if (!error.empty()) {
        json["error"] = error;
    }
    return json;
}

int BatchSummary::filesGenerated() const {
    return static_cast<int>(std::count_if(partitions.begin(), partitions.end(),
        [](const PartitionResult& p) { return p.status == PartitionStatus::GENERATED; }));
}

int BatchSummary::filesSkipped() const {
    return static_cast<int>(std::count_if(partitions.begin(), partitions.end(),
        [](const PartitionResult& p) { return p.status == PartitionStatus::SKIPPED; }));
}

int BatchSummary::filesFailed() const {
    return static_cast<int>(std::count_if(partitions.begin(), partitions.end(),
        [](const PartitionResult& p) { return p.status == PartitionStatus::FAILED; }));
}

int64_t BatchSummary::totalBytes() const {
    int64_t total = 0;
    for (const auto& p : partitions) {
        if (p.status == PartitionStatus::GENERATED) {
            total += p.sizeBytes;
        }
    }
    return total;
}

Json::Value BatchSummary::toJson() const {
    Json::Value json;
    json["outputDir"] = outputDir;
    json["startYear"] = startYear;
    json["endYear"] = endYear;
    json["filesGenerated"] = filesGenerated();
    json["filesSkipped"] = filesSkipped();
    json["filesFailed"] = filesFailed();
    json["totalBytes"] = Json::Int64(totalBytes());

    Json::Value list(Json::arrayValue);
    for (const auto& p : partitions) {
        list.append(p.toJson());
    }
    json["partitions"] = list;
    return json;
}

// =============================================================================
// BatchService
// =============================================================================

BatchService::BatchService(
    repositories::OutputRepository* outputRepo,
    GenerationService* generationService)
    : outputRepo_(outputRepo)
    , generationService_(generationService) {
    if (!outputRepo_ || !generationService_) {
        throw std::invalid_argument("BatchService: dependencies cannot be nullptr");
    }
}

BatchSummary BatchService::run(const BatchOptions& options, std::ostream* progressStream) {
    pesel::core::validateYearRange(options.startYear, options.endYear);

    outputRepo_->ensureBaseDirectory();
    spdlog::info("Storing generated files in: {}", outputRepo_->getBasePath());

    BatchSummary summary;
    summary.outputDir = outputRepo_->getBasePath();
    summary.startYear = options.startYear;
    summary.endYear = options.endYear;

    std::vector<std::pair<int, pesel::core::Sex>> work;
    for (int year = options.startYear; year <= options.endYear; year++) {
        work.emplace_back(year, pesel::core::Sex::MALE);
        work.emplace_back(year, pesel::core::Sex::FEMALE);
    }
    summary.partitions.resize(work.size());

    const int jobs = std::max(1, std::min(options.jobs, static_cast<int>(work.size())));

    if (jobs == 1) {
        std::ostream* bar = options.showProgress ? progressStream : nullptr;
        for (size_t i = 0; i < work.size(); i++) {
            summary.partitions[i] = processPartition(work[i].first, work[i].second, bar);
        }
    } else {
        spdlog::info("Generating with {} worker threads", jobs);

        std::atomic<size_t> next{0};
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(jobs));

        for (int w = 0; w < jobs; w++) {
            workers.emplace_back([this, &work, &summary, &next]() {
                for (size_t i = next++; i < work.size(); i = next++) {
                    summary.partitions[i] = processPartition(work[i].first, work[i].second, nullptr);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    spdlog::info("Generation complete!");
    spdlog::info("Total files generated: {}", summary.filesGenerated());
    if (summary.filesSkipped() > 0) {
        spdlog::info("Total files skipped: {}", summary.filesSkipped());
    }
    if (summary.filesFailed() > 0) {
        spdlog::error("Total files failed: {}", summary.filesFailed());
    }
    spdlog::info("Total size: {:.1f} GB", static_cast<double>(summary.totalBytes()) / kBytesPerGb);

    return summary;
}

PartitionResult BatchService::processPartition(
    int year, pesel::core::Sex sex, std::ostream* progressStream) {

    PartitionResult result;
    result.year = year;
    result.sex = sex;
    result.path = outputRepo_->partitionPath(year, sex);

    if (outputRepo_->exists(result.path)) {
        spdlog::info("File {} already exists, skipping...", result.path);
        result.status = PartitionStatus::SKIPPED;
        return result;
    }

    spdlog::info("Generating {} PESELs for year {}...", pesel::core::sexToString(sex), year);

    try {
        auto range = pesel::core::RangeEnumerator::forYears(year, year, sex);

        std::unique_ptr<common::ConsoleProgressBar> bar;
        if (progressStream) {
            bar = std::make_unique<common::ConsoleProgressBar>(*progressStream);
        }

        result.identifiers = generationService_->writeRange(range, result.path, bar.get());
        result.sizeBytes = outputRepo_->getSize(result.path);
        result.status = PartitionStatus::GENERATED;

        spdlog::info("Generated {} ({:.1f} MB)", result.path,
                     static_cast<double>(result.sizeBytes) / kBytesPerMb);
    } catch (const common::PeselException& e) {
        result.status = PartitionStatus::FAILED;
        result.error = std::string(e.what()) + " (" + e.getDetails() + ")";
        spdlog::error("Error generating PESELs for year {} and sex {}: {}",
                      year, pesel::core::sexToString(sex), result.error);
    } catch (const std::exception& e) {
        result.status = PartitionStatus::FAILED;
        result.error = e.what();
        spdlog::error("Error generating PESELs for year {} and sex {}: {}",
                      year, pesel::core::sexToString(sex), result.error);
    }

    return result;
}

void BatchService::writeSummary(const BatchSummary& summary) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::string content = Json::writeString(builder, summary.toJson()) + "\n";

    const std::string path = outputRepo_->filePath(SUMMARY_FILE_NAME);
    outputRepo_->writeAtomically(path, [&content](std::ostream& out) -> uint64_t {
        out << content;
        return 1;
    });
    spdlog::debug("Summary written to {}", path);
}

} // namespace services
