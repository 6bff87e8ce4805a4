#pragma once

#include <optional>
#include <string>
#include <vector>
#include <pesel/core/types.h>

/**
 * @file cli_options.h
 * @brief Command line parsing for pesel-generator
 *
 * Usage:
 *   pesel-generator generate START_YEAR [END_YEAR] [--sex male|female] [--output FILE] [--force] [--no-progress]
 *   pesel-generator single --date YYYY-MM-DD [--seq N] [--sex male|female]
 *   pesel-generator verify PESEL... [--json]
 *   pesel-generator batch [--start-year N] [--end-year N] [--output-dir DIR] [--jobs N] [--json]
 */

namespace common {

enum class Command {
    HELP,
    GENERATE,
    SINGLE,
    VERIFY,
    BATCH
};

/**
 * @brief Parsed command line
 *
 * Options left empty fall back to ConfigManager values in main.
 */
struct CliOptions {
    Command command = Command::HELP;
    std::string helpTopic;                  ///< Subcommand whose usage was requested

    // generate
    int startYear = 0;
    int endYear = 0;
    pesel::core::SexFilter sex;
    std::optional<std::string> outputFile;
    bool force = false;
    std::optional<bool> progress;           ///< false when --no-progress given

    // single
    std::string date;
    std::optional<int> sequentialNumber;

    // verify
    std::vector<std::string> identifiers;

    // verify / batch
    bool json = false;

    // batch
    std::optional<int> batchStartYear;
    std::optional<int> batchEndYear;
    std::optional<std::string> outputDir;
    std::optional<int> jobs;
};

/**
 * @brief Parse arguments (program name excluded)
 * @throws InvalidArgumentException on unknown commands, options or bad values
 */
CliOptions parseArguments(const std::vector<std::string>& args);

/**
 * @brief Usage text for a subcommand ("" for the overall usage)
 */
std::string usage(const std::string& command = "");

/**
 * @brief Strict decimal integer parsing
 * @throws InvalidArgumentException naming the option on failure
 */
int parseIntArgument(const std::string& option, const std::string& value);

} // namespace common
