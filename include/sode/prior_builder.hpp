#pragma once

/**
 * @file prior_builder.hpp
 * @brief Conception-date priors from field observations.
 *
 * Observation counts (bull fights, copulations, back-calculated conception
 * dates) are laid out over the 245-day conception window starting June 1
 * and normalized. Sparse samples can be smoothed with a Gaussian kernel, and
 * several herds can be pooled with per-source weights.
 */

#include "sode/calendar.hpp"

#include <string>
#include <vector>

namespace sode {

struct PriorSmoothingParams {
    int window = 21;      // kernel width in days ("3 week smooth")
    double alpha = 2.5;   // kernel shape: larger alpha, narrower bell
};

struct PriorResult {
    ConceptionPrior prior{};
    Status status = Status::OK;

    bool ok() const { return status == Status::OK; }
};

struct WeightedPrior {
    const ConceptionPrior* prior = nullptr;
    double weight = 1.0;
};

// Nonnegative, finite, sums to 1 within `tolerance`.
bool is_valid_prior(const ConceptionPrior& prior, double tolerance = 1e-9);

// counts.size() must equal kPriorLength; negative or non-finite counts are
// INVALID_RANGE, an all-zero vector NORMALIZATION_FAILURE.
PriorResult prior_from_counts(const std::vector<double>& counts);

// Normalized kernel weights, offsets -window/2 .. window - window/2 - 1.
std::vector<double> gaussian_kernel(int window, double alpha);

// Windowed Gaussian smoothing. Positions whose window would run off either
// end (the first window/2 and the last window - window/2) are set to zero,
// then the result is renormalized.
PriorResult smooth_prior(const ConceptionPrior& prior,
                         const PriorSmoothingParams& params = {});

// Weighted pooling of several priors, renormalized.
PriorResult mix_priors(const std::vector<WeightedPrior>& parts);

// Read a prior table: one value per row, or "offset value" rows. Row order
// defines the offset. Throws std::runtime_error on I/O or parse errors and on
// a row count other than kPriorLength; the values are normalized.
PriorResult load_prior(const std::string& path);

}  // namespace sode
