/**
 * @file main.cpp
 * @brief PESEL Generator - command line entry point
 *
 * Subcommands:
 *   generate  every identifier of a year range (stdout or file)
 *   single    one identifier for a date
 *   verify    check digit verification
 *   batch     per-year, per-sex partition files
 *
 * Identifiers go to stdout; logs and progress bars go to stderr.
 */

#include "common/cli_options.h"
#include "common/progress_bar.h"
#include "repositories/output_repository.h"
#include "services/batch_service.h"
#include "services/generation_service.h"

#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "logging/logger.h"

#include <pesel/core/calendar_date.h>
#include <pesel/core/encoder.h>
#include <pesel/core/range_enumerator.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

/**
 * @brief Runtime dependencies wired once per invocation
 */
struct AppContext {
    std::unique_ptr<repositories::OutputRepository> outputRepo;
    std::unique_ptr<services::GenerationService> generationService;
    std::unique_ptr<services::BatchService> batchService;
};

AppContext createContext(const std::string& outputDir) {
    AppContext ctx;
    ctx.outputRepo = std::make_unique<repositories::OutputRepository>(outputDir);
    ctx.generationService = std::make_unique<services::GenerationService>(ctx.outputRepo.get());
    ctx.batchService = std::make_unique<services::BatchService>(
        ctx.outputRepo.get(), ctx.generationService.get());
    return ctx;
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

bool confirmOverwrite(const std::string& path) {
    std::cerr << "File " << path << " already exists. Overwrite? [y/N] ";
    std::cerr.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

// =============================================================================
// Subcommands
// =============================================================================

int runGenerate(const common::CliOptions& opts, AppContext& ctx) {
    auto& config = common::ConfigManager::getInstance();

    auto range = pesel::core::RangeEnumerator::forYears(opts.startYear, opts.endYear, opts.sex);

    spdlog::info("Generating PESEL numbers for years {}-{}...", opts.startYear, opts.endYear);
    if (opts.sex) {
        spdlog::info("Generating only {} PESELs", pesel::core::sexToString(*opts.sex));
    }

    if (!opts.outputFile) {
        uint64_t count = ctx.generationService->streamRange(range, std::cout);
        spdlog::info("Generated {} PESEL numbers", count);
        return kExitOk;
    }

    const std::string& path = *opts.outputFile;
    if (ctx.outputRepo->exists(path) && !opts.force && !confirmOverwrite(path)) {
        std::cout << "Operation cancelled." << std::endl;
        return kExitOk;
    }

    bool showProgress = opts.progress.value_or(config.getBool(common::ConfigManager::PROGRESS, true));
    std::unique_ptr<common::ConsoleProgressBar> bar;
    if (showProgress) {
        bar = std::make_unique<common::ConsoleProgressBar>(std::cerr);
    }

    uint64_t count = ctx.generationService->writeRange(range, path, bar.get());
    spdlog::info("Generated {} PESEL numbers and saved to {}", count, path);
    return kExitOk;
}

int runSingle(const common::CliOptions& opts) {
    auto date = pesel::core::CalendarDate::parse(opts.date);
    pesel::core::validateYearRange(date.year(), date.year());

    auto id = pesel::core::generateSingle(date, opts.sequentialNumber, opts.sex);
    std::cout << id << std::endl;
    return kExitOk;
}

int runVerify(const common::CliOptions& opts, AppContext& ctx) {
    auto results = ctx.generationService->verify(opts.identifiers);

    bool allValid = std::all_of(results.begin(), results.end(),
        [](const services::GenerationService::VerificationResult& r) { return r.valid; });

    if (opts.json) {
        Json::Value list(Json::arrayValue);
        for (const auto& r : results) {
            list.append(r.toJson());
        }
        std::cout << writeJson(list) << std::endl;
    } else {
        for (const auto& r : results) {
            if (r.valid) {
                std::cout << r.input << ": OK\n";
            } else {
                std::cout << r.input << ": INVALID (" << r.error << ")\n";
            }
        }
        std::cout.flush();
    }

    return allValid ? kExitOk : kExitFailure;
}

int runBatch(const common::CliOptions& opts, AppContext& ctx) {
    auto& config = common::ConfigManager::getInstance();

    services::BatchOptions batchOptions;
    batchOptions.startYear = opts.batchStartYear.value_or(
        config.getInt(common::ConfigManager::BATCH_START_YEAR,
                      common::ConfigManager::DEFAULT_BATCH_START_YEAR));
    batchOptions.endYear = opts.batchEndYear.value_or(
        config.getInt(common::ConfigManager::BATCH_END_YEAR,
                      common::ConfigManager::DEFAULT_BATCH_END_YEAR));
    batchOptions.jobs = opts.jobs.value_or(config.getInt(common::ConfigManager::BATCH_JOBS, 1));
    if (batchOptions.jobs < 1) {
        throw common::ConfigException(common::ConfigManager::BATCH_JOBS, "must be at least 1");
    }
    batchOptions.showProgress = config.getBool(common::ConfigManager::PROGRESS, true);

    auto summary = ctx.batchService->run(batchOptions, &std::cerr);
    ctx.batchService->writeSummary(summary);

    if (opts.json) {
        std::cout << writeJson(summary.toJson()) << std::endl;
    }

    return summary.filesFailed() > 0
        ? common::errorCodeToExitStatus(common::ErrorCode::OUTPUT_WRITE_FAILED)
        : kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    common::Logger::initialize(
        "pesel-generator",
        common::ConfigManager::getEnv(common::ConfigManager::LOG_LEVEL, "info"),
        !common::ConfigManager::getEnv(common::ConfigManager::LOG_FILE).empty(),
        common::ConfigManager::getEnv(common::ConfigManager::LOG_FILE));

    std::vector<std::string> args(argv + 1, argv + argc);
    bool jsonErrors = std::find(args.begin(), args.end(), "--json") != args.end();

    try {
        auto opts = common::parseArguments(args);

        if (opts.command == common::Command::HELP) {
            std::cout << common::usage(opts.helpTopic);
            return kExitOk;
        }

        auto& config = common::ConfigManager::getInstance();
        std::string outputDir = opts.outputDir.value_or(
            config.getString(common::ConfigManager::OUTPUT_DIR,
                             common::ConfigManager::DEFAULT_OUTPUT_DIR));
        AppContext ctx = createContext(outputDir);

        switch (opts.command) {
            case common::Command::GENERATE: return runGenerate(opts, ctx);
            case common::Command::SINGLE: return runSingle(opts);
            case common::Command::VERIFY: return runVerify(opts, ctx);
            case common::Command::BATCH: return runBatch(opts, ctx);
            default: break;
        }
        std::cout << common::usage();
        return kExitOk;

    } catch (const common::PeselException& e) {
        spdlog::error("{}{}", e.what(), e.getDetails().empty() ? "" : " (" + e.getDetails() + ")");
        if (jsonErrors) {
            std::cout << writeJson(e.toJson()) << std::endl;
        }
        if (e.getCode() == common::ErrorCode::INVALID_ARGUMENT) {
            std::cerr << common::usage(args.empty() ? "" : args[0]);
        }
        common::Logger::flush();
        return common::errorCodeToExitStatus(e.getCode());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        common::Logger::flush();
        return kExitFailure;
    }
}
