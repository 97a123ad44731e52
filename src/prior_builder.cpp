#include "sode/prior_builder.hpp"
#include "sode/table_reader.hpp"

#include <cmath>
#include <stdexcept>

namespace sode {

namespace {

PriorResult normalized(const std::vector<double>& values) {
    PriorResult r;
    if (values.size() != static_cast<size_t>(kPriorLength)) {
        r.status = Status::INVALID_RANGE;
        return r;
    }
    double total = 0.0;
    for (double v : values) {
        if (!std::isfinite(v) || v < 0.0) {
            r.status = Status::INVALID_RANGE;
            return r;
        }
        total += v;
    }
    if (total <= 0.0) {
        r.status = Status::NORMALIZATION_FAILURE;
        return r;
    }
    for (size_t i = 0; i < values.size(); ++i) r.prior[i] = values[i] / total;
    return r;
}

}  // namespace

bool is_valid_prior(const ConceptionPrior& prior, double tolerance) {
    double total = 0.0;
    for (double p : prior) {
        if (!std::isfinite(p) || p < 0.0) return false;
        total += p;
    }
    return std::abs(total - 1.0) <= tolerance;
}

PriorResult prior_from_counts(const std::vector<double>& counts) {
    return normalized(counts);
}

std::vector<double> gaussian_kernel(int window, double alpha) {
    if (window < 1) window = 1;
    const double half = window / 2.0;
    const int left = window / 2;
    const double a = std::abs(alpha);

    std::vector<double> w(static_cast<size_t>(window));
    double total = 0.0;
    for (int x = 0; x < window; ++x) {
        const double n = static_cast<double>(x - left);
        const double k = a * n / half;
        w[static_cast<size_t>(x)] = std::exp(-0.5 * k * k);
        total += w[static_cast<size_t>(x)];
    }
    for (double& v : w) v /= total;
    return w;
}

PriorResult smooth_prior(const ConceptionPrior& prior, const PriorSmoothingParams& params) {
    PriorResult r;
    if (params.window < 1 || params.window > kPriorLength) {
        r.status = Status::INVALID_RANGE;
        return r;
    }

    const std::vector<double> w = gaussian_kernel(params.window, params.alpha);
    const int left = params.window / 2;
    const int right = params.window - left;

    std::vector<double> out(static_cast<size_t>(kPriorLength), 0.0);
    for (int i = left; i <= kPriorLength - right - 1; ++i) {
        double acc = 0.0;
        for (int k = 0; k < params.window; ++k) {
            acc += w[static_cast<size_t>(k)] * prior[static_cast<size_t>(i - left + k)];
        }
        out[static_cast<size_t>(i)] = acc;
    }
    return normalized(out);
}

PriorResult mix_priors(const std::vector<WeightedPrior>& parts) {
    PriorResult r;
    if (parts.empty()) {
        r.status = Status::INVALID_SELECTION;
        return r;
    }

    std::vector<double> acc(static_cast<size_t>(kPriorLength), 0.0);
    for (const auto& part : parts) {
        if (part.prior == nullptr || !std::isfinite(part.weight) || part.weight < 0.0) {
            r.status = Status::INVALID_SELECTION;
            return r;
        }
        for (size_t i = 0; i < acc.size(); ++i) {
            acc[i] += part.weight * (*part.prior)[i];
        }
    }
    return normalized(acc);
}

PriorResult load_prior(const std::string& path) {
    TableReader reader(path);
    std::vector<double> values;
    values.reserve(kPriorLength);

    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        // Value is the last column; a leading offset/day column is informational.
        values.push_back(parse_double_field(fields.back(), reader));
    }
    if (values.size() != static_cast<size_t>(kPriorLength)) {
        throw std::runtime_error("Prior table " + path + " has " +
                                 std::to_string(values.size()) + " rows, expected " +
                                 std::to_string(kPriorLength));
    }
    return normalized(values);
}

}  // namespace sode
