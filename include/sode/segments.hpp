#pragma once
// Contiguous runs of positive probability on the circular calendar.

#include "sode/calendar.hpp"

#include <vector>

namespace sode {

// Maximal nonzero runs of `calendar`, sorted by low_day (a run that wraps
// through Dec 31 therefore comes last). Runs are pairwise disjoint and their
// union is exactly the nonzero support. An all-zero calendar yields no runs;
// a calendar with no zero at all yields the single run [1, 365].
std::vector<Segment> find_segments(const ProbabilityCalendar& calendar);

// Sum of segment masses.
double segments_mass(const std::vector<Segment>& segments);

}  // namespace sode
