#pragma once

/**
 * @file gestation.hpp
 * @brief Diaphyseal depth -> plausible gestation-age range.
 *
 * Two calibrations per element:
 *   - DepthLengthModel: quantile regressions log(length) = a + b*log(depth)
 *     at the lower (2.5%) and upper (97.5%) quantiles.
 *   - GrowthEnvelope: lower and upper simulated diaphysis length for each
 *     gestation day 1..N.
 *
 * A depth d with measurement error e gives the length bounds
 *   min_length = exp(a_lo + b_lo*log(d - e))
 *   max_length = exp(a_hi + b_hi*log(d + e))
 * The earliest age is the first day whose upper envelope reaches min_length,
 * the latest the last day whose lower envelope stays at or below max_length.
 */

#include "sode/calendar.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sode {

enum class Element : uint8_t { TIBIA, FEMUR, RADIUS, HUMERUS, UNKNOWN };

constexpr size_t kNumElements = 4;

Element element_from_string(const std::string& name);
const char* element_to_string(Element element);

struct DepthLengthModel {
    double a_lower = 0.0;
    double b_lower = 1.0;
    double a_upper = 0.0;
    double b_upper = 1.0;

    double lower_length(double depth) const { return std::exp(a_lower + b_lower * std::log(depth)); }
    double upper_length(double depth) const { return std::exp(a_upper + b_upper * std::log(depth)); }
};

// Index 0 holds gestation day 1.
struct GrowthEnvelope {
    std::vector<double> lower;
    std::vector<double> upper;

    size_t days() const { return lower.size(); }
    bool valid() const { return !lower.empty() && lower.size() == upper.size(); }
};

struct ResolverParams {
    double measurement_error = 0.225;  // mm, added/subtracted from the depth
};

struct GestationEstimate {
    Status status = Status::OK;
    GestationAgeRange range;
    double min_length = 0.0;
    double max_length = 0.0;

    bool ok() const { return status == Status::OK; }
};

struct DepthLimits {
    double min_depth = 0.0;
    double max_depth = 0.0;
};

// Multiply the upper envelope by a body-size length ratio (e.g. ancient /
// modern mean length). The lower envelope is left unchanged.
GrowthEnvelope scale_envelope(const GrowthEnvelope& envelope, double ratio);

// Per-element upper-envelope multipliers, indexed by Element.
using SizeRatios = std::array<double, kNumElements>;

SizeRatios unit_size_ratios();

class GestationResolver {
public:
    explicit GestationResolver(const ResolverParams& params = {});

    void set_calibration(Element element, const DepthLengthModel& model,
                         const GrowthEnvelope& envelope);
    bool has_calibration(Element element) const;

    // OUT_OF_CALIBRATION when the depth does not exceed the measurement error,
    // the element is uncalibrated, or no gestation day fits the bounds.
    GestationEstimate resolve(Element element, double depth) const;

    // Depths whose length bounds fall inside the simulated growth period.
    std::optional<DepthLimits> depth_limits(Element element) const;

    // Apply scale_envelope() to one element; no-op when it is uncalibrated.
    void apply_size_ratio(Element element, double ratio);
    void apply_size_ratios(const SizeRatios& ratios);

    // Load "<dir>/depth_models.tsv" (rows: element tau a b; tau < 0.5 is
    // the lower quantile) and "<dir>/envelope_<element>.tsv" (rows: day lower
    // upper). Elements without an envelope file stay uncalibrated. Throws
    // std::runtime_error on unreadable or malformed tables.
    static GestationResolver load(const std::string& dir, const ResolverParams& params = {});

private:
    struct Calibration {
        DepthLengthModel model;
        GrowthEnvelope envelope;
    };

    ResolverParams params_;
    std::array<std::optional<Calibration>, kNumElements> calibrations_;
};

GrowthEnvelope load_growth_envelope(const std::string& path);

}  // namespace sode
