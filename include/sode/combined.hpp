#pragma once
// Fusing several death-date estimates believed to record one death.
//
// Each estimate constrains the gestation age; the constraints are intersected
// (largest minimum, smallest maximum) and the prior is convolved again over
// the narrower range.

#include "sode/calendar.hpp"

#include <vector>

namespace sode {

// Intersection of all ranges. The result may have min_day > max_day, which
// marks an empty intersection; an empty input yields {0, 0}.
GestationAgeRange intersect_ranges(const std::vector<GestationAgeRange>& ranges);

struct CombinedEstimate {
    Status status = Status::OK;
    GestationAgeRange range;        // intersected range, even when empty
    ProbabilityCalendar calendar{}; // all zero unless status == OK

    bool ok() const { return status == Status::OK; }
};

// INVALID_SELECTION for fewer than two ranges, EMPTY_INTERSECTION when the
// ranges share no gestation day, otherwise the convolver's status.
CombinedEstimate estimate_combined(const ConceptionPrior& prior,
                                   const std::vector<GestationAgeRange>& ranges);

}  // namespace sode
