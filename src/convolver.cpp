#include "sode/convolver.hpp"
#include "sode/cycle_mapper.hpp"

#include <cmath>

namespace sode {

CycleArray accumulate_cycle(const ConceptionPrior& prior,
                            const GestationAgeRange& range) {
    CycleArray cycle{};
    if (!range.valid()) return cycle;

    for (int y = range.min_day; y <= range.max_day; ++y) {
        double* window = cycle.data() + (y - 1);
        for (int i = 0; i < kPriorLength; ++i) {
            window[i] += prior[static_cast<size_t>(i)];
        }
    }
    return cycle;
}

ConvolutionResult convolve_death_date(const ConceptionPrior& prior,
                                      const GestationAgeRange& range) {
    ConvolutionResult result;
    if (!range.valid()) {
        result.status = Status::INVALID_RANGE;
        return result;
    }

    const CycleArray cycle = accumulate_cycle(prior, range);
    ProbabilityCalendar folded = CycleMapper::instance().fold(cycle);

    const double total = calendar_mass(folded);
    result.folded_mass = total;
    if (!std::isfinite(total) || total <= kMinFoldedMass) {
        result.status = Status::NORMALIZATION_FAILURE;
        return result;
    }

    // Division keeps exact zeros at exactly zero.
    for (double& p : folded) p /= total;
    result.calendar = folded;
    return result;
}

}  // namespace sode
