#include "sode/gestation.hpp"
#include "sode/table_reader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace sode {

namespace {

constexpr std::array<Element, kNumElements> kAllElements = {
    Element::TIBIA, Element::FEMUR, Element::RADIUS, Element::HUMERUS};

size_t slot(Element element) { return static_cast<size_t>(element); }

}  // namespace

Element element_from_string(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "tibia") return Element::TIBIA;
    if (s == "femur") return Element::FEMUR;
    if (s == "radius") return Element::RADIUS;
    if (s == "humerus") return Element::HUMERUS;
    return Element::UNKNOWN;
}

const char* element_to_string(Element element) {
    switch (element) {
        case Element::TIBIA: return "tibia";
        case Element::FEMUR: return "femur";
        case Element::RADIUS: return "radius";
        case Element::HUMERUS: return "humerus";
        default: return "unknown";
    }
}

GrowthEnvelope scale_envelope(const GrowthEnvelope& envelope, double ratio) {
    GrowthEnvelope out = envelope;
    for (double& v : out.upper) v *= ratio;
    return out;
}

GestationResolver::GestationResolver(const ResolverParams& params) : params_(params) {}

void GestationResolver::set_calibration(Element element, const DepthLengthModel& model,
                                        const GrowthEnvelope& envelope) {
    if (element == Element::UNKNOWN) return;
    calibrations_[slot(element)] = Calibration{model, envelope};
}

bool GestationResolver::has_calibration(Element element) const {
    return element != Element::UNKNOWN && calibrations_[slot(element)].has_value();
}

GestationEstimate GestationResolver::resolve(Element element, double depth) const {
    GestationEstimate est;
    est.status = Status::OUT_OF_CALIBRATION;
    if (!has_calibration(element)) return est;

    const Calibration& cal = *calibrations_[slot(element)];
    if (!cal.envelope.valid()) return est;

    const double err = params_.measurement_error;
    if (!std::isfinite(depth) || depth - err <= 0.0) return est;

    est.min_length = cal.model.lower_length(depth - err);
    est.max_length = cal.model.upper_length(depth + err);

    const auto& lower = cal.envelope.lower;
    const auto& upper = cal.envelope.upper;

    int min_day = 0;
    for (size_t i = 0; i < upper.size(); ++i) {
        if (upper[i] >= est.min_length) {
            min_day = static_cast<int>(i) + 1;
            break;
        }
    }
    int max_day = 0;
    for (size_t i = lower.size(); i-- > 0;) {
        if (lower[i] <= est.max_length) {
            max_day = static_cast<int>(i) + 1;
            break;
        }
    }

    GestationAgeRange range{min_day, max_day};
    if (min_day == 0 || max_day == 0 || !range.valid()) return est;

    est.range = range;
    est.status = Status::OK;
    return est;
}

std::optional<DepthLimits> GestationResolver::depth_limits(Element element) const {
    if (!has_calibration(element)) return std::nullopt;
    const Calibration& cal = *calibrations_[slot(element)];
    if (!cal.envelope.valid()) return std::nullopt;

    // Invert the upper model at the smallest day-1 length and the lower
    // model at the largest final-day length.
    DepthLimits lim;
    lim.min_depth = std::exp((std::log(cal.envelope.lower.front()) - cal.model.a_upper) /
                             cal.model.b_upper);
    lim.max_depth = std::exp((std::log(cal.envelope.upper.back()) - cal.model.a_lower) /
                             cal.model.b_lower);
    return lim;
}

SizeRatios unit_size_ratios() {
    SizeRatios r;
    r.fill(1.0);
    return r;
}

void GestationResolver::apply_size_ratio(Element element, double ratio) {
    if (!has_calibration(element)) return;
    auto& cal = calibrations_[slot(element)];
    cal->envelope = scale_envelope(cal->envelope, ratio);
}

void GestationResolver::apply_size_ratios(const SizeRatios& ratios) {
    for (size_t i = 0; i < kNumElements; ++i) {
        if (ratios[i] != 1.0) apply_size_ratio(static_cast<Element>(i), ratios[i]);
    }
}

GrowthEnvelope load_growth_envelope(const std::string& path) {
    TableReader reader(path);
    GrowthEnvelope env;
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        if (fields.size() < 3) {
            throw std::runtime_error(reader.where() + ": expected 'day lower upper'");
        }
        const int day = parse_int_field(fields[0], reader);
        if (day != static_cast<int>(env.days()) + 1) {
            throw std::runtime_error(reader.where() + ": days must run 1, 2, 3, ...");
        }
        const double lo = parse_double_field(fields[1], reader);
        const double hi = parse_double_field(fields[2], reader);
        if (lo <= 0.0 || hi < lo) {
            throw std::runtime_error(reader.where() + ": need 0 < lower <= upper");
        }
        env.lower.push_back(lo);
        env.upper.push_back(hi);
    }
    if (!env.valid()) {
        throw std::runtime_error("Growth envelope " + path + " is empty");
    }
    return env;
}

GestationResolver GestationResolver::load(const std::string& dir, const ResolverParams& params) {
    namespace fs = std::filesystem;

    std::array<DepthLengthModel, kNumElements> models{};
    std::array<int, kNumElements> seen{};

    const std::string models_path = (fs::path(dir) / "depth_models.tsv").string();
    TableReader reader(models_path);
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        if (fields.size() < 4) {
            throw std::runtime_error(reader.where() + ": expected 'element tau a b'");
        }
        const Element el = element_from_string(fields[0]);
        if (el == Element::UNKNOWN) {
            throw std::runtime_error(reader.where() + ": unknown element '" + fields[0] + "'");
        }
        std::string tau_field = fields[1];
        double scale = 1.0;
        if (!tau_field.empty() && tau_field.back() == '%') {
            tau_field.pop_back();
            scale = 0.01;
        }
        const double tau = parse_double_field(tau_field, reader) * scale;
        const double a = parse_double_field(fields[2], reader);
        const double b = parse_double_field(fields[3], reader);
        if (b == 0.0) {
            throw std::runtime_error(reader.where() + ": slope must be nonzero");
        }

        DepthLengthModel& m = models[slot(el)];
        if (tau < 0.5) {
            m.a_lower = a;
            m.b_lower = b;
            seen[slot(el)] |= 1;
        } else {
            m.a_upper = a;
            m.b_upper = b;
            seen[slot(el)] |= 2;
        }
    }

    GestationResolver resolver(params);
    for (Element el : kAllElements) {
        const fs::path plain = fs::path(dir) / ("envelope_" + std::string(element_to_string(el)) + ".tsv");
        fs::path env_path = plain;
        if (!fs::exists(env_path)) env_path = plain.string() + ".gz";
        if (!fs::exists(env_path)) continue;

        if (seen[slot(el)] != 3) {
            throw std::runtime_error(models_path + ": element " + element_to_string(el) +
                                     " needs both a lower and an upper quantile model");
        }
        resolver.set_calibration(el, models[slot(el)], load_growth_envelope(env_path.string()));
    }
    return resolver;
}

}  // namespace sode
