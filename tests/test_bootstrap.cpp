// tests/test_bootstrap.cpp
//
// Ancient/modern length-ratio bootstrap.
//
//   T1: interpolated quantiles
//   T2: constant groups give a constant ratio
//   T3: same seed -> same result, independent of thread count
//   T4: a 0.9 size reduction is recovered
//   T5: invalid input and length tables
//   T6: one ratio per element, from its most common side
//   T7: ratio tables

#include "sode/bootstrap.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

sode::LengthSample reduced_sample() {
    sode::LengthSample s;
    s.modern_male = {100.0, 102.0, 98.0, 101.0, 99.0, 103.0, 97.0};
    s.modern_female = {90.0, 92.0, 88.0, 91.0, 89.0};
    for (double v : s.modern_male) s.ancient_male.push_back(0.9 * v);
    for (double v : s.modern_female) s.ancient_female.push_back(0.9 * v);
    return s;
}

int test_quantile() {
    std::cout << "[T1] quantiles\n";
    int failed = 0;

    std::vector<double> v = {5.0, 1.0, 4.0, 2.0, 3.0};
    expect(sode::quantile(v, 0.5) == 3.0, "median of 1..5", failed);
    expect(sode::quantile(v, 0.25) == 2.0, "first quartile", failed);
    expect(std::abs(sode::quantile(v, 0.1) - 1.4) < 1e-12, "interpolated 10%", failed);
    expect(sode::quantile(v, 0.0) == 1.0 && sode::quantile(v, 1.0) == 5.0, "extremes", failed);

    std::vector<double> empty;
    expect(sode::quantile(empty, 0.5) == 0.0, "empty input", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_constant() {
    std::cout << "[T2] constant groups\n";
    int failed = 0;

    sode::LengthSample s;
    s.modern_male = {10.0, 10.0, 10.0};
    s.modern_female = {10.0, 10.0};
    s.ancient_male = {12.0, 12.0};
    s.ancient_female = {12.0, 12.0, 12.0, 12.0};

    sode::BootstrapParams params;
    params.resamples = 500;
    const auto q = sode::bootstrap_length_ratio(s, params);
    expect(q.ok(), "ok", failed);
    expect(q.num_ratios == 1000, "ratios of both sexes pooled", failed);
    expect(q.lower == 1.2 && q.median == 1.2 && q.upper == 1.2, "ratio 1.2 everywhere", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_determinism() {
    std::cout << "[T3] reproducibility\n";
    int failed = 0;
    const auto s = reduced_sample();

    sode::BootstrapParams params;
    params.resamples = 2000;
    const auto a = sode::bootstrap_means(s.modern_male, params, 0);
    const auto b = sode::bootstrap_means(s.modern_male, params, 0);
    expect(a == b, "same seed, same means", failed);

    const auto other_stream = sode::bootstrap_means(s.modern_male, params, 1);
    expect(a != other_stream, "streams differ", failed);

    params.seed = 11;
    expect(a != sode::bootstrap_means(s.modern_male, params, 0), "seeds differ", failed);
    params.seed = 10;

#ifdef _OPENMP
    const int saved = omp_get_max_threads();
    omp_set_num_threads(1);
    const auto serial = sode::bootstrap_length_ratio(s, params);
    omp_set_num_threads(4);
    const auto parallel = sode::bootstrap_length_ratio(s, params);
    omp_set_num_threads(saved);
    expect(serial.lower == parallel.lower && serial.median == parallel.median &&
               serial.upper == parallel.upper,
           "thread count does not change the result", failed);
#endif

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_recovery() {
    std::cout << "[T4] recovers a 0.9 size ratio\n";
    int failed = 0;

    const auto q = sode::bootstrap_length_ratio(reduced_sample());
    expect(q.ok(), "ok", failed);
    expect(q.num_ratios == 20000, "2 x 10000 ratios", failed);
    expect(q.lower < q.median && q.median < q.upper, "ordered quantiles", failed);
    expect(std::abs(q.median - 0.9) < 0.01, "median near 0.9: " + std::to_string(q.median),
           failed);
    expect(q.lower > 0.85 && q.upper < 0.95, "interval around 0.9", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_invalid_and_load() {
    std::cout << "[T5] invalid input and length tables\n";
    int failed = 0;

    auto s = reduced_sample();
    s.ancient_female.clear();
    expect(sode::bootstrap_length_ratio(s).status == sode::Status::INVALID_SELECTION,
           "empty group", failed);

    sode::BootstrapParams none;
    none.resamples = 0;
    expect(sode::bootstrap_length_ratio(reduced_sample(), none).status ==
               sode::Status::INVALID_RANGE,
           "zero resamples", failed);

    const std::string path =
        (std::filesystem::temp_directory_path() / "sode_test_lengths.tsv").string();
    {
        std::ofstream out(path);
        out << "# element\tside\tform\tsex\tlength\n"
            << "tibia\tleft\tmodern\tmale\t100\n"
            << "Tibia\tleft\tmodern\tf\t90\n"
            << "tibia\tleft\tantiq\tM\t88\n"
            << "tibia\tright\tancient\tfemale\t80\n"
            << "femur\tleft\tancient\tfemale\t82\n";
    }
    const auto rows = sode::load_length_rows(path);
    expect(rows.size() == 5, "five rows", failed);
    expect(rows[1].element == sode::Element::TIBIA && !rows[1].male && !rows[1].ancient,
           "element and sex parsed", failed);
    expect(rows[2].ancient && rows[3].ancient && rows[3].side == "right",
           "antiq and ancient forms, side kept", failed);
    expect(rows[4].element == sode::Element::FEMUR && rows[4].length == 82.0, "femur row",
           failed);

    {
        std::ofstream out(path);
        out << "tibia\tleft\tmedieval\tmale\t100\n";
    }
    bool threw = false;
    try {
        (void)sode::load_length_rows(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "unknown form throws", failed);

    {
        std::ofstream out(path);
        out << "ulna\tleft\tmodern\tmale\t100\n";
    }
    threw = false;
    try {
        (void)sode::load_length_rows(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "unknown element throws", failed);
    std::filesystem::remove(path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

sode::LengthRow length_row(sode::Element element, const std::string& side, bool ancient,
                           bool male, double length) {
    sode::LengthRow row;
    row.element = element;
    row.side = side;
    row.ancient = ancient;
    row.male = male;
    row.length = length;
    return row;
}

// Tibia shrinks to 0.9 and the femur grows to 1.1. Two right tibiae with a
// different ratio are outnumbered by the left ones and must not count.
std::vector<sode::LengthRow> two_element_rows() {
    using sode::Element;
    std::vector<sode::LengthRow> rows;
    for (int i = 0; i < 2; ++i) {
        rows.push_back(length_row(Element::TIBIA, "left", false, true, 100.0));
        rows.push_back(length_row(Element::TIBIA, "left", false, false, 100.0));
        rows.push_back(length_row(Element::TIBIA, "left", true, true, 90.0));
        rows.push_back(length_row(Element::TIBIA, "left", true, false, 90.0));
        rows.push_back(length_row(Element::FEMUR, "right", false, true, 100.0));
        rows.push_back(length_row(Element::FEMUR, "right", false, false, 100.0));
        rows.push_back(length_row(Element::FEMUR, "right", true, true, 110.0));
        rows.push_back(length_row(Element::FEMUR, "right", true, false, 110.0));
    }
    rows.push_back(length_row(Element::TIBIA, "right", false, true, 50.0));
    rows.push_back(length_row(Element::TIBIA, "right", true, true, 90.0));
    return rows;
}

int test_element_ratios() {
    std::cout << "[T6] per-element ratios\n";
    int failed = 0;
    using sode::Element;

    const auto rows = two_element_rows();
    expect(sode::most_common_side(rows, Element::TIBIA) == "left", "tibia side", failed);
    expect(sode::most_common_side(rows, Element::FEMUR) == "right", "femur side", failed);
    expect(sode::most_common_side(rows, Element::RADIUS).empty(), "no radius rows", failed);

    const auto tibia = sode::select_length_sample(rows, Element::TIBIA);
    expect(tibia.modern_male.size() == 2 && tibia.ancient_male.size() == 2,
           "minority side dropped", failed);

    sode::BootstrapParams params;
    params.resamples = 200;
    const auto ratios = sode::bootstrap_element_ratios(rows, params);
    const auto& t = ratios[static_cast<size_t>(Element::TIBIA)];
    const auto& f = ratios[static_cast<size_t>(Element::FEMUR)];
    expect(t.ok() && f.ok(), "tibia and femur bootstrapped", failed);
    expect(std::abs(t.lower - 0.9) < 1e-12 && std::abs(t.upper - 0.9) < 1e-12,
           "tibia ratio 0.9", failed);
    expect(std::abs(f.lower - 1.1) < 1e-12 && std::abs(f.upper - 1.1) < 1e-12,
           "femur ratio 1.1", failed);
    expect(t.num_ratios == 400 && f.num_ratios == 400, "ratio counts", failed);
    expect(ratios[static_cast<size_t>(Element::RADIUS)].status ==
               sode::Status::INVALID_SELECTION &&
               ratios[static_cast<size_t>(Element::HUMERUS)].status ==
                   sode::Status::INVALID_SELECTION,
           "elements without lengths", failed);

    // Equal counts: the alphabetically first side wins.
    std::vector<sode::LengthRow> tied = {
        length_row(Element::RADIUS, "right", false, true, 1.0),
        length_row(Element::RADIUS, "left", false, true, 1.0)};
    expect(sode::most_common_side(tied, Element::RADIUS) == "left", "tie broken by name", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_ratio_tables() {
    std::cout << "[T7] ratio tables\n";
    int failed = 0;

    const std::string path =
        (std::filesystem::temp_directory_path() / "sode_test_ratios.tsv").string();
    {
        std::ofstream out(path);
        out << "# element\tlower\tmedian\tupper\tratios\n"
            << "humerus\t0.95\t0.97\t0.99\t20000\n"
            << "# radius: invalid_selection\n"
            << "tibia\t0.88\t0.9\t0.92\t20000\n";
    }
    const auto ratios = sode::load_size_ratios(path);
    expect(ratios[static_cast<size_t>(sode::Element::HUMERUS)] == 0.97, "humerus median",
           failed);
    expect(ratios[static_cast<size_t>(sode::Element::TIBIA)] == 0.9, "tibia median", failed);
    expect(ratios[static_cast<size_t>(sode::Element::RADIUS)] == 1.0 &&
               ratios[static_cast<size_t>(sode::Element::FEMUR)] == 1.0,
           "missing elements stay at 1", failed);

    {
        std::ofstream out(path);
        out << "femur\t0.1\t-0.5\t0.9\n";
    }
    bool threw = false;
    try {
        (void)sode::load_size_ratios(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "nonpositive ratio throws", failed);
    std::filesystem::remove(path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_quantile();
    total += test_constant();
    total += test_determinism();
    total += test_recovery();
    total += test_invalid_and_load();
    total += test_element_ratios();
    total += test_ratio_tables();

    if (total == 0) {
        std::cout << "\nAll bootstrap tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
