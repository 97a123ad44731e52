#include "sode/combined.hpp"
#include "sode/convolver.hpp"

#include <algorithm>

namespace sode {

GestationAgeRange intersect_ranges(const std::vector<GestationAgeRange>& ranges) {
    if (ranges.empty()) return {};

    GestationAgeRange out = ranges.front();
    for (const auto& r : ranges) {
        out.min_day = std::max(out.min_day, r.min_day);
        out.max_day = std::min(out.max_day, r.max_day);
    }
    return out;
}

CombinedEstimate estimate_combined(const ConceptionPrior& prior,
                                   const std::vector<GestationAgeRange>& ranges) {
    CombinedEstimate est;
    if (ranges.size() < 2) {
        est.status = Status::INVALID_SELECTION;
        return est;
    }

    est.range = intersect_ranges(ranges);
    if (est.range.min_day > est.range.max_day) {
        est.status = Status::EMPTY_INTERSECTION;
        return est;
    }

    ConvolutionResult conv = convolve_death_date(prior, est.range);
    est.status = conv.status;
    if (conv.ok()) est.calendar = conv.calendar;
    return est;
}

}  // namespace sode
