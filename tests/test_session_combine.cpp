// tests/test_session_combine.cpp
//
// Session bookkeeping and combination of entries from one individual.
//
//   T1: entries are numbered from 1 and carry segments
//   T2: combining [50,60] twice equals the direct convolution exactly
//   T3: order independence and idempotence
//   T4: disjoint ranges -> EMPTY_INTERSECTION, nothing appended
//   T5: combined entries can be combined again
//   T6: invalid selections

#include "sode/combined.hpp"
#include "sode/convolver.hpp"
#include "sode/session.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

sode::ConceptionPrior test_prior() {
    sode::ConceptionPrior p{};
    double total = 0.0;
    for (int i = 0; i < sode::kPriorLength; ++i) {
        const double x = (i - 45.0) / 25.0;
        p[static_cast<size_t>(i)] = std::exp(-0.5 * x * x);
        total += p[static_cast<size_t>(i)];
    }
    for (auto& v : p) v /= total;
    return p;
}

int test_numbering() {
    std::cout << "[T1] entry numbering\n";
    int failed = 0;
    sode::Session session(test_prior());

    const auto a = session.add_measured({120, 180});
    const auto b = session.add_measured({200, 260}, "tibia 14.2");
    expect(a.ok() && a.index == 1, "first entry is 1", failed);
    expect(b.ok() && b.index == 2, "second entry is 2", failed);
    expect(session.size() == 2, "two entries", failed);
    expect(session.entry(1).label == "entry 1", "default label", failed);
    expect(session.entry(2).label == "tibia 14.2", "given label", failed);
    expect(session.entry(2).provenance == sode::Provenance::MEASURED, "measured", failed);
    expect(!session.entry(1).segments.empty(), "segments computed", failed);

    const auto bad = session.add_measured({10, 5});
    expect(bad.status == sode::Status::INVALID_RANGE && bad.index == 0,
           "invalid range not appended", failed);
    expect(session.size() == 2, "still two entries", failed);

    bool threw = false;
    try {
        (void)session.entry(3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expect(threw, "unknown entry throws out_of_range", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_combine_identical() {
    std::cout << "[T2] [50,60] combined with [50,60]\n";
    int failed = 0;
    const auto prior = test_prior();
    sode::Session session(prior);
    session.add_measured({50, 60});
    session.add_measured({50, 60});

    const auto c = session.combine({1, 2});
    expect(c.ok() && c.index == 3, "appended as entry 3", failed);
    expect(c.range == sode::GestationAgeRange{50, 60}, "range unchanged", failed);

    const auto direct = sode::convolve_death_date(prior, {50, 60});
    expect(session.entry(3).calendar == direct.calendar, "identical to direct convolution",
           failed);
    expect(session.entry(3).provenance == sode::Provenance::COMBINED, "combined provenance",
           failed);
    expect(session.entry(3).sources == std::vector<size_t>({1, 2}), "sources 1, 2", failed);
    expect(session.entry(3).label == "combined [entries 1, 2]", "combined label", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_order_and_idempotence() {
    std::cout << "[T3] order independence and idempotence\n";
    int failed = 0;
    sode::Session session(test_prior());
    session.add_measured({100, 200});
    session.add_measured({150, 250});
    session.add_measured({120, 180});

    const auto forward = session.combine({1, 2, 3});
    const auto backward = session.combine({3, 1, 2});
    const auto repeated = session.combine({2, 2, 1, 3, 1});
    expect(forward.ok() && backward.ok() && repeated.ok(), "all ok", failed);
    expect(forward.range == sode::GestationAgeRange{150, 180}, "intersection [150, 180]", failed);
    expect(forward.calendar == backward.calendar, "order independent", failed);
    expect(forward.calendar == repeated.calendar, "duplicates ignored", failed);
    expect(repeated.sources == std::vector<size_t>({1, 2, 3}), "sources sorted and unique",
           failed);

    // A range intersected with itself is itself.
    const auto self = sode::intersect_ranges({{100, 200}, {100, 200}});
    expect(self == sode::GestationAgeRange{100, 200}, "idempotent intersection", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_empty_intersection() {
    std::cout << "[T4] disjoint ranges\n";
    int failed = 0;
    sode::Session session(test_prior());
    session.add_measured({1, 50});
    session.add_measured({100, 150});

    const auto c = session.combine({1, 2});
    expect(c.status == sode::Status::EMPTY_INTERSECTION, "empty intersection", failed);
    expect(c.empty_intersection(), "empty_intersection()", failed);
    expect(c.range.min_day == 100 && c.range.max_day == 50, "range reported as [100, 50]",
           failed);
    expect(!c.range.valid(), "range invalid", failed);
    expect(sode::count_nonzero(c.calendar) == 0, "all-zero calendar", failed);
    expect(c.index == 0 && session.size() == 2, "nothing appended", failed);

    const auto est = sode::estimate_combined(session.prior(), {{1, 50}, {100, 150}});
    expect(est.status == sode::Status::EMPTY_INTERSECTION && sode::count_nonzero(est.calendar) == 0,
           "estimator agrees", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_chained() {
    std::cout << "[T5] combining a combined entry\n";
    int failed = 0;
    sode::Session session(test_prior());
    session.add_measured({100, 200});
    session.add_measured({150, 250});
    session.add_measured({170, 300});

    const auto first = session.combine({1, 2});
    expect(first.ok() && first.index == 4, "entry 4 = [150, 200]", failed);
    const auto second = session.combine({4, 3});
    expect(second.ok() && second.index == 5, "entry 5", failed);
    expect(second.range == sode::GestationAgeRange{170, 200}, "range [170, 200]", failed);

    const auto all = session.combine({1, 2, 3});
    expect(all.ok() && all.calendar == second.calendar, "same as combining all three", failed);

    // Interval analysis can use combined entries too.
    const auto a = session.analyze({5}, sode::Interval::full_year());
    expect(a.status == sode::Status::DEGENERATE_QUERY, "entry 5 against whole year", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_invalid_selection() {
    std::cout << "[T6] invalid selections\n";
    int failed = 0;
    sode::Session session(test_prior());
    session.add_measured({100, 200});
    session.add_measured({150, 250});

    expect(session.combine({1}).status == sode::Status::INVALID_SELECTION, "one entry", failed);
    expect(session.combine({1, 1}).status == sode::Status::INVALID_SELECTION,
           "one distinct entry", failed);
    expect(session.combine({1, 3}).status == sode::Status::INVALID_SELECTION, "unknown entry",
           failed);
    expect(session.combine({0, 1}).status == sode::Status::INVALID_SELECTION, "entry 0", failed);
    expect(session.analyze({1, 7}, sode::Interval{1, 10}).status ==
               sode::Status::INVALID_SELECTION,
           "analysis with unknown entry", failed);
    expect(session.size() == 2, "nothing appended", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_numbering();
    total += test_combine_identical();
    total += test_order_and_idempotence();
    total += test_empty_intersection();
    total += test_chained();
    total += test_invalid_selection();

    if (total == 0) {
        std::cout << "\nAll session tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
