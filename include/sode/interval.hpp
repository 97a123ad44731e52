#pragma once

/**
 * @file interval.hpp
 * @brief Joint probabilities of several death-date calendars over a date interval.
 *
 * For the days of the interval:
 *   product[d] = prod_k D_k(d)   (all deaths on day d)
 *   minimum[d] = min_k D_k(d), maximum[d] = max_k D_k(d)   (plot envelopes)
 * Days outside the interval are zero in all three arrays.
 *
 *   same_day_probability   = sum_d product[d]
 *   all_within_probability = prod_k sum_d D_k(d)
 *
 * The envelopes are for display only; the two scalars are the result.
 */

#include "sode/calendar.hpp"

#include <cstddef>
#include <vector>

namespace sode {

// Which of the scalars carry a statement for the caller.
enum class IntervalReport : uint8_t {
    NO_STATEMENT,             // one calendar, whole year
    SAME_DAY_ONLY,            // several calendars, whole year
    ALL_WITHIN_ONLY,          // one calendar, specific interval
    SAME_DAY_AND_ALL_WITHIN   // several calendars, specific interval
};

struct IntervalAnalysis {
    Status status = Status::OK;
    IntervalReport report = IntervalReport::NO_STATEMENT;
    Interval interval;
    size_t num_calendars = 0;

    ProbabilityCalendar product{};
    ProbabilityCalendar minimum{};
    ProbabilityCalendar maximum{};
    std::vector<double> within;  // per-calendar mass inside the interval

    double same_day_probability = 0.0;
    double all_within_probability = 0.0;

    // Degenerate queries still carry (trivial) values.
    bool ok() const {
        return status == Status::OK || status == Status::DEGENERATE_QUERY;
    }
};

IntervalReport classify_interval_query(size_t num_calendars, const Interval& interval);

// INVALID_SELECTION for an empty or null-containing set, INVALID_RANGE for an
// interval day outside 1..365, DEGENERATE_QUERY for one calendar against
// [1, 365].
IntervalAnalysis analyze_interval(const std::vector<const ProbabilityCalendar*>& calendars,
                                  const Interval& interval);

}  // namespace sode
