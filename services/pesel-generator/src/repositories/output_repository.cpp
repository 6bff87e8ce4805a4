/**
 * @file output_repository.cpp
 * @brief Local filesystem output implementation
 */

#include "output_repository.h"
#include "exception/exceptions.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace repositories {

OutputRepository::OutputRepository(std::string basePath)
    : basePath_(std::move(basePath)) {}

void OutputRepository::ensureBaseDirectory() const {
    fs::path dir(basePath_);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        if (!fs::is_directory(dir, ec)) {
            throw common::OutputException(
                common::ErrorCode::OUTPUT_DIRECTORY_FAILED,
                "Output path exists and is not a directory",
                basePath_);
        }
        return;
    }

    if (!fs::create_directories(dir, ec) || ec) {
        throw common::OutputException(
            common::ErrorCode::OUTPUT_DIRECTORY_FAILED,
            "Failed to create directory" + (ec ? ": " + ec.message() : std::string()),
            basePath_);
    }
    spdlog::debug("Created output directory: {}", basePath_);
}

std::string OutputRepository::partitionPath(int year, pesel::core::Sex sex) const {
    return filePath(std::to_string(year) + "_" + pesel::core::sexToString(sex) + ".txt");
}

std::string OutputRepository::filePath(const std::string& fileName) const {
    return (fs::path(basePath_) / fileName).string();
}

bool OutputRepository::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

int64_t OutputRepository::getSize(const std::string& path) const {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw common::OutputException(
            common::ErrorCode::OUTPUT_WRITE_FAILED,
            "Failed to get file size: " + ec.message(),
            path);
    }
    return static_cast<int64_t>(size);
}

uint64_t OutputRepository::writeAtomically(const std::string& path, const Producer& producer) const {
    const std::string tmp = path + ".tmp";
    uint64_t written = 0;

    try {
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw common::OutputException(
                    common::ErrorCode::OUTPUT_WRITE_FAILED,
                    "Failed to create file",
                    tmp);
            }

            written = producer(out);

            out.flush();
            if (!out) {
                throw common::OutputException(
                    common::ErrorCode::OUTPUT_WRITE_FAILED,
                    "Failed while writing file",
                    tmp);
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            throw common::OutputException(
                common::ErrorCode::OUTPUT_WRITE_FAILED,
                "rename() failed: " + ec.message(),
                path);
        }
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    return written;
}

} // namespace repositories
