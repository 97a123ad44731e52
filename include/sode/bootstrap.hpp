#pragma once
// Bootstrap of the ancient/modern body-size length ratio, per element.
//
// For one element the four groups (modern/ancient x male/female) are
// resampled with replacement; the per-sex ratios ancient_mean / modern_mean
// of matching resamples are pooled and summarized by their 2.5%, 50% and
// 97.5% quantiles. Only the element's most common side enters the sample.
// Resample r of stream s draws from its own generator seeded by (seed, r, s),
// so results do not depend on the thread count.

#include "sode/calendar.hpp"
#include "sode/gestation.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace sode {

struct BootstrapParams {
    int resamples = 10000;
    uint64_t seed = 10;
};

// One adult long-bone measurement.
struct LengthRow {
    Element element = Element::UNKNOWN;
    std::string side;
    bool ancient = false;
    bool male = false;
    double length = 0.0;
};

struct LengthSample {
    std::vector<double> modern_male;
    std::vector<double> modern_female;
    std::vector<double> ancient_male;
    std::vector<double> ancient_female;
};

struct RatioQuantiles {
    Status status = Status::OK;
    double lower = 0.0;    // 2.5%
    double median = 0.0;   // 50%
    double upper = 0.0;    // 97.5%
    size_t num_ratios = 0;

    bool ok() const { return status == Status::OK; }
};

// Indexed by Element; elements without measurements report INVALID_SELECTION.
using ElementRatios = std::array<RatioQuantiles, kNumElements>;

// Sample quantile with linear interpolation between order statistics
// (h = (n - 1) * p). `values` is sorted in place. Empty input returns 0.
double quantile(std::vector<double>& values, double p);

// Means of `resamples` bootstrap resamples of `values`; `stream` separates
// the generators of different groups sharing one seed.
std::vector<double> bootstrap_means(const std::vector<double>& values,
                                    const BootstrapParams& params,
                                    uint64_t stream);

// INVALID_SELECTION when any group is empty, INVALID_RANGE for a
// nonpositive modern length or resample count. The four groups use streams
// stream_base .. stream_base + 3.
RatioQuantiles bootstrap_length_ratio(const LengthSample& sample,
                                      const BootstrapParams& params = {},
                                      uint64_t stream_base = 0);

// Side with the most rows for `element`; ties go to the alphabetically
// first side. Empty when the element has no rows.
std::string most_common_side(const std::vector<LengthRow>& rows, Element element);

// Rows of `element` on its most common side, grouped by form and sex.
LengthSample select_length_sample(const std::vector<LengthRow>& rows, Element element);

// Bootstrap every element from its own sample.
ElementRatios bootstrap_element_ratios(const std::vector<LengthRow>& rows,
                                       const BootstrapParams& params = {});

// Rows "element side form sex length" with form in {modern, ancient, antiq}
// and sex in {male, female, m, f}. Throws std::runtime_error on malformed
// rows.
std::vector<LengthRow> load_length_rows(const std::string& path);

// Read a ratio table as written by `sode ratio` (rows "element lower median
// upper ..."). The median column is the multiplier; elements not listed keep
// 1.0. Throws std::runtime_error on unknown elements or nonpositive ratios.
SizeRatios load_size_ratios(const std::string& path);

}  // namespace sode
