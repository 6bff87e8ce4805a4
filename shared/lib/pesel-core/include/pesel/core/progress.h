/**
 * @file progress.h
 * @brief Progress observer interface for range enumeration
 *
 * Observers are notified by RangeEnumerator::run() and never influence
 * what is emitted. Implementations live with the caller (console bar,
 * log lines, test recorders).
 */

#pragma once

#include <cstdint>

namespace pesel::core {

/// @brief Snapshot of enumeration progress
struct ProgressUpdate {
    int64_t daysProcessed = 0;
    int64_t totalDays = 0;
    int percent = 0;                  ///< floor(daysProcessed * 100 / totalDays)
    uint64_t identifiersEmitted = 0;
};

/**
 * @brief Progress observer interface
 */
class IProgressObserver {
public:
    virtual ~IProgressObserver() = default;

    /**
     * @brief Called after a day is processed, only when the integer
     *        percentage changed (the first day always reports)
     */
    virtual void onProgress(const ProgressUpdate& update) = 0;

    /**
     * @brief Called once after the last day
     */
    virtual void onComplete(const ProgressUpdate& update) = 0;
};

} // namespace pesel::core
