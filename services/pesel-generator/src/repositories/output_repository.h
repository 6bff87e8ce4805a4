#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <pesel/core/types.h>

/**
 * @file output_repository.h
 * @brief Local filesystem access for generated identifier files
 *
 * Files are produced through a temporary sibling ("<path>.tmp") that is
 * renamed into place only after the producer finished, so an interrupted or
 * failed run never leaves a partial output file behind.
 */

namespace repositories {

class OutputRepository {
public:
    /// Writes content to the stream, returns the number of records written
    using Producer = std::function<uint64_t(std::ostream&)>;

    /**
     * @param basePath Directory that partition files live in
     */
    explicit OutputRepository(std::string basePath);

    const std::string& getBasePath() const { return basePath_; }

    /**
     * @brief Create the base directory (recursively) if missing
     * @throws common::OutputException (OUTPUT_DIRECTORY_FAILED)
     */
    void ensureBaseDirectory() const;

    /**
     * @brief Partition file path: <basePath>/<year>_<sex>.txt
     */
    std::string partitionPath(int year, pesel::core::Sex sex) const;

    /**
     * @brief Path of a file directly under the base directory
     */
    std::string filePath(const std::string& fileName) const;

    bool exists(const std::string& path) const;

    /**
     * @brief File size in bytes
     * @throws common::OutputException (OUTPUT_WRITE_FAILED) if it cannot be read
     */
    int64_t getSize(const std::string& path) const;

    /**
     * @brief Write a file through a temporary sibling and rename it into place
     *
     * The temporary file is removed when the producer throws or the stream
     * reports an error; the exception is propagated.
     *
     * @return Value returned by the producer
     * @throws common::OutputException (OUTPUT_WRITE_FAILED)
     */
    uint64_t writeAtomically(const std::string& path, const Producer& producer) const;

private:
    std::string basePath_;
};

} // namespace repositories
