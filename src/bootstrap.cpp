#include "sode/bootstrap.hpp"
#include "sode/table_reader.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <stdexcept>
#include <utility>

namespace sode {

namespace {

constexpr std::array<Element, kNumElements> kAllElements = {
    Element::TIBIA, Element::FEMUR, Element::RADIUS, Element::HUMERUS};

}  // namespace

double quantile(std::vector<double>& values, double p) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double h = static_cast<double>(values.size() - 1) * p;
    const size_t lo = static_cast<size_t>(std::floor(h));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    return values[lo] + (h - static_cast<double>(lo)) * (values[hi] - values[lo]);
}

std::vector<double> bootstrap_means(const std::vector<double>& values,
                                    const BootstrapParams& params,
                                    uint64_t stream) {
    const int R = params.resamples;
    std::vector<double> means(R > 0 ? static_cast<size_t>(R) : 0, 0.0);
    if (values.empty() || R <= 0) return means;

    const size_t n = values.size();

    #pragma omp parallel for schedule(static)
    for (int r = 0; r < R; ++r) {
        std::seed_seq seq{static_cast<uint32_t>(params.seed),
                          static_cast<uint32_t>(params.seed >> 32),
                          static_cast<uint32_t>(r),
                          static_cast<uint32_t>(stream)};
        std::mt19937_64 rng(seq);
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        double sum = 0.0;
        for (size_t i = 0; i < n; ++i) sum += values[pick(rng)];
        means[static_cast<size_t>(r)] = sum / static_cast<double>(n);
    }
    return means;
}

RatioQuantiles bootstrap_length_ratio(const LengthSample& sample,
                                      const BootstrapParams& params,
                                      uint64_t stream_base) {
    RatioQuantiles out;
    if (sample.modern_male.empty() || sample.modern_female.empty() ||
        sample.ancient_male.empty() || sample.ancient_female.empty()) {
        out.status = Status::INVALID_SELECTION;
        return out;
    }
    if (params.resamples <= 0) {
        out.status = Status::INVALID_RANGE;
        return out;
    }
    for (const auto* group : {&sample.modern_male, &sample.modern_female}) {
        for (double v : *group) {
            if (!(v > 0.0) || !std::isfinite(v)) {
                out.status = Status::INVALID_RANGE;
                return out;
            }
        }
    }

    const auto mm = bootstrap_means(sample.modern_male, params, stream_base + 0);
    const auto mf = bootstrap_means(sample.modern_female, params, stream_base + 1);
    const auto am = bootstrap_means(sample.ancient_male, params, stream_base + 2);
    const auto af = bootstrap_means(sample.ancient_female, params, stream_base + 3);

    std::vector<double> ratios;
    ratios.reserve(mm.size() * 2);
    for (size_t r = 0; r < mm.size(); ++r) ratios.push_back(am[r] / mm[r]);
    for (size_t r = 0; r < mf.size(); ++r) ratios.push_back(af[r] / mf[r]);

    out.num_ratios = ratios.size();
    out.lower = quantile(ratios, 0.025);
    out.median = quantile(ratios, 0.5);
    out.upper = quantile(ratios, 0.975);
    return out;
}

std::string most_common_side(const std::vector<LengthRow>& rows, Element element) {
    std::map<std::string, size_t> counts;
    for (const auto& row : rows) {
        if (row.element == element) ++counts[row.side];
    }
    std::string best;
    size_t best_count = 0;
    for (const auto& [side, count] : counts) {
        if (count > best_count) {
            best = side;
            best_count = count;
        }
    }
    return best;
}

LengthSample select_length_sample(const std::vector<LengthRow>& rows, Element element) {
    LengthSample sample;
    const std::string side = most_common_side(rows, element);
    for (const auto& row : rows) {
        if (row.element != element || row.side != side) continue;
        if (row.ancient) {
            (row.male ? sample.ancient_male : sample.ancient_female).push_back(row.length);
        } else {
            (row.male ? sample.modern_male : sample.modern_female).push_back(row.length);
        }
    }
    return sample;
}

ElementRatios bootstrap_element_ratios(const std::vector<LengthRow>& rows,
                                       const BootstrapParams& params) {
    ElementRatios out;
    for (Element el : kAllElements) {
        const size_t slot = static_cast<size_t>(el);
        out[slot] = bootstrap_length_ratio(select_length_sample(rows, el), params, 4 * slot);
    }
    return out;
}

std::vector<LengthRow> load_length_rows(const std::string& path) {
    TableReader reader(path);
    std::vector<LengthRow> rows;
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        if (fields.size() < 5) {
            throw std::runtime_error(reader.where() +
                                     ": expected 'element side form sex length'");
        }
        LengthRow row;
        row.element = element_from_string(fields[0]);
        if (row.element == Element::UNKNOWN) {
            throw std::runtime_error(reader.where() + ": unknown element '" + fields[0] + "'");
        }
        row.side = fields[1];

        const std::string& form = fields[2];
        if (form == "ancient" || form == "antiq") {
            row.ancient = true;
        } else if (form != "modern") {
            throw std::runtime_error(reader.where() + ": unknown form '" + form + "'");
        }

        const std::string& sex = fields[3];
        row.male = (sex == "male" || sex == "m" || sex == "M");
        const bool female = (sex == "female" || sex == "f" || sex == "F");
        if (!row.male && !female) {
            throw std::runtime_error(reader.where() + ": unknown sex '" + sex + "'");
        }

        row.length = parse_double_field(fields[4], reader);
        rows.push_back(std::move(row));
    }
    return rows;
}

SizeRatios load_size_ratios(const std::string& path) {
    TableReader reader(path);
    SizeRatios ratios = unit_size_ratios();
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        if (fields.size() < 3) {
            throw std::runtime_error(reader.where() + ": expected 'element lower median upper'");
        }
        const Element el = element_from_string(fields[0]);
        if (el == Element::UNKNOWN) {
            throw std::runtime_error(reader.where() + ": unknown element '" + fields[0] + "'");
        }
        const double median = parse_double_field(fields[2], reader);
        if (!(median > 0.0)) {
            throw std::runtime_error(reader.where() + ": ratio must be > 0");
        }
        ratios[static_cast<size_t>(el)] = median;
    }
    return ratios;
}

}  // namespace sode
