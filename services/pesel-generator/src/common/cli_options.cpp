/**
 * @file cli_options.cpp
 * @brief Command line parsing implementation
 */

#include "cli_options.h"
#include "exception/exceptions.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace common {

namespace {

const std::string& requireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw InvalidArgumentException("Missing value for option", args[i]);
    }
    return args[++i];
}

pesel::core::Sex parseSex(const std::string& option, const std::string& value) {
    auto sex = pesel::core::sexFromString(value);
    if (!sex) {
        throw InvalidArgumentException(
            "Invalid value for " + option + ": expected male or female", value);
    }
    return *sex;
}

bool isHelp(const std::string& arg) {
    return arg == "--help" || arg == "-h";
}

void parseGenerate(const std::vector<std::string>& args, CliOptions& opts) {
    std::vector<std::string> positional;

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--sex" || arg == "-s") {
            opts.sex = parseSex(arg, requireValue(args, i));
        } else if (arg == "--output" || arg == "-o") {
            opts.outputFile = requireValue(args, i);
        } else if (arg == "--force") {
            opts.force = true;
        } else if (arg == "--no-progress") {
            opts.progress = false;
        } else if (!arg.empty() && arg[0] == '-') {
            throw InvalidArgumentException("Unknown option for generate", arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw InvalidArgumentException("generate requires START_YEAR");
    }
    if (positional.size() > 2) {
        throw InvalidArgumentException("Too many arguments for generate", positional[2]);
    }

    opts.startYear = parseIntArgument("START_YEAR", positional[0]);
    opts.endYear = positional.size() == 2
        ? parseIntArgument("END_YEAR", positional[1])
        : opts.startYear;
}

void parseSingle(const std::vector<std::string>& args, CliOptions& opts) {
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--date" || arg == "-d") {
            opts.date = requireValue(args, i);
        } else if (arg == "--seq") {
            opts.sequentialNumber = parseIntArgument(arg, requireValue(args, i));
        } else if (arg == "--sex" || arg == "-s") {
            opts.sex = parseSex(arg, requireValue(args, i));
        } else {
            throw InvalidArgumentException("Unknown option for single", arg);
        }
    }

    if (opts.date.empty()) {
        throw InvalidArgumentException("single requires --date YYYY-MM-DD");
    }
}

void parseVerify(const std::vector<std::string>& args, CliOptions& opts) {
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--json") {
            opts.json = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            throw InvalidArgumentException("Unknown option for verify", arg);
        } else {
            opts.identifiers.push_back(arg);
        }
    }

    if (opts.identifiers.empty()) {
        throw InvalidArgumentException("verify requires at least one PESEL");
    }
}

void parseBatch(const std::vector<std::string>& args, CliOptions& opts) {
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--start-year") {
            opts.batchStartYear = parseIntArgument(arg, requireValue(args, i));
        } else if (arg == "--end-year") {
            opts.batchEndYear = parseIntArgument(arg, requireValue(args, i));
        } else if (arg == "--output-dir") {
            opts.outputDir = requireValue(args, i);
        } else if (arg == "--jobs" || arg == "-j") {
            int jobs = parseIntArgument(arg, requireValue(args, i));
            if (jobs < 1) {
                throw InvalidArgumentException("--jobs must be at least 1", std::to_string(jobs));
            }
            opts.jobs = jobs;
        } else if (arg == "--json") {
            opts.json = true;
        } else {
            throw InvalidArgumentException("Unknown option for batch", arg);
        }
    }
}

} // anonymous namespace

int parseIntArgument(const std::string& option, const std::string& value) {
    if (value.empty()) {
        throw InvalidArgumentException("Invalid integer for " + option, value);
    }

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0' ||
        parsed < INT_MIN || parsed > INT_MAX) {
        throw InvalidArgumentException("Invalid integer for " + option, value);
    }
    return static_cast<int>(parsed);
}

CliOptions parseArguments(const std::vector<std::string>& args) {
    CliOptions opts;

    if (args.empty() || isHelp(args[0])) {
        opts.command = Command::HELP;
        return opts;
    }

    const std::string& command = args[0];
    for (size_t i = 1; i < args.size(); i++) {
        if (isHelp(args[i])) {
            opts.command = Command::HELP;
            opts.helpTopic = command;
            return opts;
        }
    }

    if (command == "generate") {
        opts.command = Command::GENERATE;
        parseGenerate(args, opts);
    } else if (command == "single") {
        opts.command = Command::SINGLE;
        parseSingle(args, opts);
    } else if (command == "verify") {
        opts.command = Command::VERIFY;
        parseVerify(args, opts);
    } else if (command == "batch") {
        opts.command = Command::BATCH;
        parseBatch(args, opts);
    } else {
        throw InvalidArgumentException("Unknown command", command);
    }

    return opts;
}

std::string usage(const std::string& command) {
    std::ostringstream out;

    if (command == "generate") {
        out << "Usage: pesel-generator generate START_YEAR [END_YEAR] [options]\n"
            << "  -s, --sex male|female  Generate only one sex\n"
            << "  -o, --output FILE      Write to FILE instead of stdout\n"
            << "  --force                Overwrite FILE without asking\n"
            << "  --no-progress          Do not show the progress bar\n";
    } else if (command == "single") {
        out << "Usage: pesel-generator single --date YYYY-MM-DD [--seq N] [--sex male|female]\n"
            << "  --seq N     Sequential number 0-9999 (default: 0)\n"
            << "  --sex       Defaults to the sex implied by the sequential number\n";
    } else if (command == "verify") {
        out << "Usage: pesel-generator verify PESEL... [--json]\n"
            << "  --json      Print results as a JSON array\n";
    } else if (command == "batch") {
        out << "Usage: pesel-generator batch [options]\n"
            << "  --start-year N    First year (default: PESEL_BATCH_START_YEAR or 1950)\n"
            << "  --end-year N      Last year (default: PESEL_BATCH_END_YEAR or 2030)\n"
            << "  --output-dir DIR  Output directory (default: PESEL_OUTPUT_DIR or generated_pesels)\n"
            << "  -j, --jobs N      Worker threads (default: PESEL_BATCH_JOBS or 1)\n"
            << "  --json            Print the summary as JSON\n";
    } else {
        out << "Usage: pesel-generator <command> [options]\n"
            << "Commands:\n"
            << "  generate   Generate every PESEL for a year range\n"
            << "  single     Generate one PESEL\n"
            << "  verify     Verify PESEL check digits\n"
            << "  batch      Generate per-year, per-sex files\n"
            << "Run 'pesel-generator <command> --help' for command options.\n";
    }

    return out.str();
}

} // namespace common
