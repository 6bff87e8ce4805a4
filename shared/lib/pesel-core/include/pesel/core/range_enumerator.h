/**
 * @file range_enumerator.h
 * @brief Lazy enumeration of every PESEL identifier in a date range
 *
 * For each day in [start, end] (ascending), sequential numbers 0..9999 are
 * visited in ascending order:
 *   - no filter : every number is emitted once, sex taken from its parity
 *                 (10000 identifiers per day)
 *   - male      : odd numbers only (5000 per day)
 *   - female    : even numbers only (5000 per day)
 *
 * Nothing is materialized: the iterator cursor is the current date and
 * sequential number. Enumerating again with the same arguments reproduces
 * the same sequence.
 */

#pragma once

#include "pesel/core/calendar_date.h"
#include "pesel/core/pesel_identifier.h"
#include "pesel/core/progress.h"
#include "pesel/core/types.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>

namespace pesel::core {

/**
 * @brief Check year bounds before any enumeration starts
 *
 * @throws common::InvalidYearRangeException if either year lies outside
 *         [kMinYear, kMaxYear] or startYear > endYear
 */
void validateYearRange(int startYear, int endYear);

class RangeEnumerator {
public:
    using Sink = std::function<void(const PeselIdentifier&)>;

    /**
     * @brief Single-pass input iterator over the range
     */
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PeselIdentifier;
        using difference_type = std::ptrdiff_t;
        using pointer = const PeselIdentifier*;
        using reference = const PeselIdentifier&;

        /// @brief End iterator
        Iterator() = default;

        reference operator*() const { return *value_; }
        pointer operator->() const { return &*value_; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class RangeEnumerator;

        Iterator(const CalendarDate& first, const CalendarDate& last, SexFilter filter);

        void load();

        std::optional<CalendarDate> current_;  ///< nullopt once exhausted
        std::optional<CalendarDate> last_;
        SexFilter filter_;
        int sequential_ = 0;
        std::optional<PeselIdentifier> value_;
    };

    /**
     * @brief Enumerate an explicit date range
     * @throws common::InvalidYearRangeException (see validateYearRange())
     */
    RangeEnumerator(const CalendarDate& start, const CalendarDate& end, SexFilter filter = std::nullopt);

    /**
     * @brief Enumerate January 1 of startYear through December 31 of endYear
     * @throws common::InvalidYearRangeException (see validateYearRange())
     */
    static RangeEnumerator forYears(int startYear, int endYear, SexFilter filter = std::nullopt);

    Iterator begin() const;
    Iterator end() const;

    const CalendarDate& startDate() const noexcept { return start_; }
    const CalendarDate& endDate() const noexcept { return end_; }
    SexFilter sexFilter() const noexcept { return filter_; }

    /// @brief Number of calendar days in the range (inclusive)
    int64_t totalDays() const;

    /// @brief 10000 without a filter, 5000 with one
    int identifiersPerDay() const noexcept;

    /// @brief totalDays() * identifiersPerDay()
    uint64_t expectedCount() const;

    /**
     * @brief Drive the enumeration, pushing every identifier into sink
     *
     * @param sink Receives identifiers in enumeration order
     * @param observer Optional progress observer (non-owning)
     * @return Number of identifiers emitted
     */
    uint64_t run(const Sink& sink, IProgressObserver* observer = nullptr) const;

private:
    CalendarDate start_;
    CalendarDate end_;
    SexFilter filter_;
};

/// @brief First sequential number visited for a filter (1 for male, else 0)
int firstSequentialNumber(SexFilter filter) noexcept;

/// @brief Step between visited sequential numbers (2 with a filter, else 1)
int sequentialStep(SexFilter filter) noexcept;

} // namespace pesel::core
