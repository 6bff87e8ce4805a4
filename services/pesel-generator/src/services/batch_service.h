#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <json/json.h>
#include <pesel/core/types.h>
#include "../repositories/output_repository.h"
#include "generation_service.h"

/**
 * @file batch_service.h
 * @brief Batch Service - one file per (year, sex) partition
 *
 * Partitions are visited year ascending, male before female, and written to
 * <outputDir>/<year>_<sex>.txt. Existing partition files are skipped, a
 * failing partition is recorded and the batch moves on.
 */

namespace services {

enum class PartitionStatus {
    GENERATED,
    SKIPPED,
    FAILED
};

std::string partitionStatusToString(PartitionStatus status);

struct BatchOptions {
    int startYear = 0;
    int endYear = 0;
    int jobs = 1;                  ///< Worker threads, each takes whole partitions
    bool showProgress = true;      ///< Only honoured with a single job
};

struct PartitionResult {
    int year = 0;
    pesel::core::Sex sex = pesel::core::Sex::MALE;
    std::string path;
    PartitionStatus status = PartitionStatus::FAILED;
    uint64_t identifiers = 0;
    int64_t sizeBytes = 0;
    std::string error;

    Json::Value toJson() const;
};

struct BatchSummary {
    std::string outputDir;
    int startYear = 0;
    int endYear = 0;
    std::vector<PartitionResult> partitions;   ///< (year, sex) order

    int filesGenerated() const;
    int filesSkipped() const;
    int filesFailed() const;

    /// @brief Sum of the sizes of files generated in this run
    int64_t totalBytes() const;

    Json::Value toJson() const;
};

class BatchService {
public:
    static constexpr const char* SUMMARY_FILE_NAME = "generation_summary.json";

    /**
     * @param outputRepo Output repository rooted at the batch directory
     * @param generationService Writer used for each partition
     * @throws std::invalid_argument if any dependency is nullptr
     */
    BatchService(repositories::OutputRepository* outputRepo, GenerationService* generationService);

    /**
     * @brief Generate every partition of the year range
     *
     * The year range is validated before anything is created on disk.
     *
     * @param options Year range, jobs, progress
     * @param progressStream Stream for progress bars (nullptr disables them)
     * @throws common::InvalidYearRangeException on a bad range
     * @throws common::OutputException if the output directory cannot be created
     */
    BatchSummary run(const BatchOptions& options, std::ostream* progressStream = nullptr);

    /**
     * @brief Write the summary as JSON to <outputDir>/generation_summary.json
     * @throws common::OutputException on I/O failure
     */
    void writeSummary(const BatchSummary& summary);

private:
    PartitionResult processPartition(int year, pesel::core::Sex sex, std::ostream* progressStream);

    repositories::OutputRepository* outputRepo_;
    GenerationService* generationService_;
};

} // namespace services
