#pragma once

/**
 * @file convolver.hpp
 * @brief Conception prior (*) uniform gestation age -> death-date calendar.
 *
 * For every gestation age y in [min_day, max_day] the prior is laid onto the
 * extended cycle starting at position y - 1 and summed. The cycle array is
 * then folded onto the 365-day ring and normalized. Ages are weighted
 * uniformly across the range.
 */

#include "sode/calendar.hpp"

namespace sode {

// Below this folded mass the calendar cannot be normalized.
constexpr double kMinFoldedMass = 1e-12;

struct ConvolutionResult {
    ProbabilityCalendar calendar{};
    Status status = Status::OK;
    double folded_mass = 0.0;  // mass before normalization

    bool ok() const { return status == Status::OK; }
};

// Unnormalized cycle accumulator (steps 1-2). Requires range.valid().
CycleArray accumulate_cycle(const ConceptionPrior& prior,
                            const GestationAgeRange& range);

// Full pipeline: accumulate, fold, normalize.
// INVALID_RANGE when the range is empty or exceeds kMaxGestationAge,
// NORMALIZATION_FAILURE when nothing was folded onto the year.
ConvolutionResult convolve_death_date(const ConceptionPrior& prior,
                                      const GestationAgeRange& range);

}  // namespace sode
