/**
 * @file range_enumerator.cpp
 * @brief Range enumeration implementation
 */

#include "pesel/core/range_enumerator.h"
#include "pesel/core/encoder.h"
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>

namespace pesel::core {

namespace {

std::string yearRangeDetails(int startYear, int endYear) {
    return "Start year: " + std::to_string(startYear) + ", End year: " + std::to_string(endYear);
}

Sex sexFor(SexFilter filter, int sequentialNumber) {
    return filter ? *filter : sexForSequential(sequentialNumber);
}

} // namespace

void validateYearRange(int startYear, int endYear) {
    if (startYear < kMinYear || startYear > kMaxYear ||
        endYear < kMinYear || endYear > kMaxYear) {
        throw common::InvalidYearRangeException(
            "Year range must be between " + std::to_string(kMinYear) +
            " and " + std::to_string(kMaxYear),
            yearRangeDetails(startYear, endYear));
    }
    if (startYear > endYear) {
        throw common::InvalidYearRangeException(
            "Start year must be less than or equal to end year",
            yearRangeDetails(startYear, endYear));
    }
}

int firstSequentialNumber(SexFilter filter) noexcept {
    return (filter && *filter == Sex::MALE) ? 1 : 0;
}

int sequentialStep(SexFilter filter) noexcept {
    return filter ? 2 : 1;
}

// =============================================================================
// Iterator
// =============================================================================

RangeEnumerator::Iterator::Iterator(const CalendarDate& first, const CalendarDate& last, SexFilter filter)
    : current_(first)
    , last_(last)
    , filter_(filter)
    , sequential_(firstSequentialNumber(filter)) {
    load();
}

void RangeEnumerator::Iterator::load() {
    if (current_) {
        value_ = encode(*current_, sequential_, sexFor(filter_, sequential_));
    } else {
        value_.reset();
    }
}

RangeEnumerator::Iterator& RangeEnumerator::Iterator::operator++() {
    if (!current_) {
        return *this;
    }

    sequential_ += sequentialStep(filter_);
    if (sequential_ > kMaxSequentialNumber) {
        sequential_ = firstSequentialNumber(filter_);
        if (*current_ == *last_) {
            current_.reset();
        } else {
            current_ = current_->next();
        }
    }

    load();
    return *this;
}

RangeEnumerator::Iterator RangeEnumerator::Iterator::operator++(int) {
    Iterator previous = *this;
    ++(*this);
    return previous;
}

bool RangeEnumerator::Iterator::operator==(const Iterator& other) const {
    if (!current_ || !other.current_) {
        return !current_ && !other.current_;
    }
    return *current_ == *other.current_ && sequential_ == other.sequential_;
}

// =============================================================================
// RangeEnumerator
// =============================================================================

RangeEnumerator::RangeEnumerator(const CalendarDate& start, const CalendarDate& end, SexFilter filter)
    : start_(start)
    , end_(end)
    , filter_(filter) {
    validateYearRange(start.year(), end.year());
    if (end < start) {
        throw common::InvalidYearRangeException(
            "Start date must not be after end date",
            "Start: " + start.toString() + ", End: " + end.toString());
    }
}

RangeEnumerator RangeEnumerator::forYears(int startYear, int endYear, SexFilter filter) {
    validateYearRange(startYear, endYear);
    return RangeEnumerator(CalendarDate::firstDayOfYear(startYear),
                           CalendarDate::lastDayOfYear(endYear),
                           filter);
}

RangeEnumerator::Iterator RangeEnumerator::begin() const {
    return Iterator(start_, end_, filter_);
}

RangeEnumerator::Iterator RangeEnumerator::end() const {
    return Iterator();
}

int64_t RangeEnumerator::totalDays() const {
    return daysBetween(start_, end_) + 1;
}

int RangeEnumerator::identifiersPerDay() const noexcept {
    return filter_ ? (kMaxSequentialNumber + 1) / 2 : kMaxSequentialNumber + 1;
}

uint64_t RangeEnumerator::expectedCount() const {
    return static_cast<uint64_t>(totalDays()) * static_cast<uint64_t>(identifiersPerDay());
}

uint64_t RangeEnumerator::run(const Sink& sink, IProgressObserver* observer) const {
    spdlog::debug("Enumerating {} to {} (filter: {}, expected: {})",
                  start_.toString(), end_.toString(),
                  filter_ ? sexToString(*filter_) : "none", expectedCount());

    const int first = firstSequentialNumber(filter_);
    const int step = sequentialStep(filter_);

    ProgressUpdate update;
    update.totalDays = totalDays();
    int lastPercent = -1;

    CalendarDate current = start_;
    while (true) {
        for (int seq = first; seq <= kMaxSequentialNumber; seq += step) {
            sink(encode(current, seq, sexFor(filter_, seq)));
            update.identifiersEmitted++;
        }

        update.daysProcessed++;
        update.percent = static_cast<int>(update.daysProcessed * 100 / update.totalDays);
        if (observer && update.percent != lastPercent) {
            observer->onProgress(update);
        }
        lastPercent = update.percent;

        if (current == end_) {
            break;
        }
        current = current.next();
    }

    if (observer) {
        observer->onComplete(update);
    }

    spdlog::debug("Enumeration finished: {} identifiers over {} days",
                  update.identifiersEmitted, update.daysProcessed);
    return update.identifiersEmitted;
}

} // namespace pesel::core
