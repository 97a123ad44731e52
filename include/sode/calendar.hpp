#pragma once

/**
 * @file calendar.hpp
 * @brief Day-of-year calendar types shared by every stage of the SODE engine.
 *
 * Day numbers are 1-based (1 = Jan 1, 365 = Dec 31, no leap day). The
 * conception prior is indexed by offset from June 1 (day 152), the first day
 * of the conception window.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sode {

constexpr int kDaysPerYear = 365;
constexpr int kPriorLength = 245;      // June 1 .. January 31
constexpr int kCycleLength = 579;      // June 1 .. December 31 of the following year
constexpr int kCycleStartDay = 152;    // June 1

// Largest gestation age whose shifted prior window still fits in the cycle.
constexpr int kMaxGestationAge = kCycleLength - kPriorLength + 1;

using ProbabilityCalendar = std::array<double, kDaysPerYear>;
using ConceptionPrior = std::array<double, kPriorLength>;
using CycleArray = std::array<double, kCycleLength>;

enum class Status : uint8_t {
    OK,
    INVALID_RANGE,          // min > max, or a day outside its valid span
    NORMALIZATION_FAILURE,  // folded mass ~0, nothing to normalize
    EMPTY_INTERSECTION,     // combined ranges do not overlap
    DEGENERATE_QUERY,       // one calendar against the whole year
    INVALID_SELECTION,      // unknown entry index or too few entries
    OUT_OF_CALIBRATION      // measurement outside the growth model
};

const char* status_to_string(Status status);

// Plausible elapsed gestation days for one measurement.
struct GestationAgeRange {
    int min_day = 0;
    int max_day = 0;

    bool valid() const {
        return min_day >= 1 && min_day <= max_day && max_day <= kMaxGestationAge;
    }
    int span() const { return max_day - min_day + 1; }

    bool operator==(const GestationAgeRange& other) const {
        return min_day == other.min_day && max_day == other.max_day;
    }
};

// Maximal run of positive probability. high_day < low_day wraps Dec 31 -> Jan 1.
struct Segment {
    int low_day = 0;
    int high_day = 0;
    double mass = 0.0;

    bool wraps() const { return high_day < low_day; }
    int length() const {
        return wraps() ? (kDaysPerYear - low_day + 1) + high_day
                       : high_day - low_day + 1;
    }
};

// Hypothesized date interval; start > end wraps through the new year.
struct Interval {
    int start_day = 1;
    int end_day = kDaysPerYear;

    bool wraps() const { return start_day > end_day; }
    bool valid() const {
        return start_day >= 1 && start_day <= kDaysPerYear &&
               end_day >= 1 && end_day <= kDaysPerYear;
    }
    bool is_full_year() const { return start_day == 1 && end_day == kDaysPerYear; }
    bool contains(int day) const {
        return wraps() ? (day >= start_day || day <= end_day)
                       : (day >= start_day && day <= end_day);
    }
    int length() const {
        return wraps() ? (kDaysPerYear - start_day + 1) + end_day
                       : end_day - start_day + 1;
    }

    static Interval full_year() { return Interval{1, kDaysPerYear}; }
};

// Visit the days of an interval in calendar order: s..e, or s..365 then 1..e.
template <typename Fn>
inline void for_each_day(const Interval& interval, Fn&& fn) {
    if (!interval.wraps()) {
        for (int d = interval.start_day; d <= interval.end_day; ++d) fn(d);
        return;
    }
    for (int d = interval.start_day; d <= kDaysPerYear; ++d) fn(d);
    for (int d = 1; d <= interval.end_day; ++d) fn(d);
}

inline bool is_valid_day(int day) { return day >= 1 && day <= kDaysPerYear; }

// Calendar values are stored 0-based; day d lives at index d - 1.
inline double at_day(const ProbabilityCalendar& calendar, int day) {
    return calendar[static_cast<size_t>(day - 1)];
}

double calendar_mass(const ProbabilityCalendar& calendar);
double interval_mass(const ProbabilityCalendar& calendar, const Interval& interval);
size_t count_nonzero(const ProbabilityCalendar& calendar);

// Month (1-12), day-of-month and "Mon D" label for a day of the year.
int month_of_day(int day);
int date_of_day(int day);
const char* month_abbrev(int month);
std::string format_day(int day);

}  // namespace sode
