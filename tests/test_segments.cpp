// tests/test_segments.cpp
//
// Contiguous nonzero runs on the circular calendar.

#include "sode/convolver.hpp"
#include "sode/segments.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

void set_days(sode::ProbabilityCalendar& cal, int from, int to, double p) {
    for (int d = from; d <= to; ++d) cal[static_cast<size_t>(d - 1)] = p;
}

// Every nonzero day is covered by exactly one segment, zero days by none.
bool covers_support_once(const sode::ProbabilityCalendar& cal,
                         const std::vector<sode::Segment>& segs) {
    for (int d = 1; d <= sode::kDaysPerYear; ++d) {
        int hits = 0;
        for (const auto& s : segs) {
            if (sode::Interval{s.low_day, s.high_day}.contains(d)) ++hits;
        }
        const bool nonzero = sode::at_day(cal, d) != 0.0;
        if (hits != (nonzero ? 1 : 0)) return false;
    }
    return true;
}

int test_wrapping_run() {
    std::cout << "[T1] run through Dec 31 -> Jan 1\n";
    int failed = 0;

    sode::ProbabilityCalendar cal{};
    set_days(cal, 350, 365, 0.025);
    set_days(cal, 1, 10, 0.025);
    set_days(cal, 100, 109, 0.024);

    const auto segs = sode::find_segments(cal);
    expect(segs.size() == 2, "two runs, got " + std::to_string(segs.size()), failed);
    if (segs.size() == 2) {
        expect(segs[0].low_day == 100 && segs[0].high_day == 109, "plain run first", failed);
        expect(segs[1].low_day == 350 && segs[1].high_day == 10, "wrapping run last", failed);
        expect(segs[1].wraps() && segs[1].length() == 26, "wrap length 26", failed);
        expect(std::abs(segs[1].mass - 26 * 0.025) < 1e-12, "wrap mass", failed);
    }
    expect(covers_support_once(cal, segs), "segments partition the support", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_degenerate_calendars() {
    std::cout << "[T2] no zeros, all zeros, single day\n";
    int failed = 0;

    sode::ProbabilityCalendar full{};
    set_days(full, 1, 365, 1.0 / 365.0);
    const auto all = sode::find_segments(full);
    expect(all.size() == 1 && all[0].low_day == 1 && all[0].high_day == 365,
           "no zero day -> [1, 365]", failed);

    const sode::ProbabilityCalendar empty{};
    expect(sode::find_segments(empty).empty(), "all-zero calendar has no runs", failed);

    sode::ProbabilityCalendar one{};
    one[199] = 1.0;
    const auto single = sode::find_segments(one);
    expect(single.size() == 1 && single[0].low_day == 200 && single[0].high_day == 200 &&
               single[0].length() == 1,
           "single-day island", failed);

    // Support touching Jan 1 without wrapping.
    sode::ProbabilityCalendar head{};
    set_days(head, 1, 5, 0.2);
    const auto h = sode::find_segments(head);
    expect(h.size() == 1 && h[0].low_day == 1 && h[0].high_day == 5 && !h[0].wraps(),
           "run starting Jan 1 does not wrap", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_convolved_calendars() {
    std::cout << "[T3] segments of convolved calendars\n";
    int failed = 0;

    // Bimodal prior: two separated conception pulses.
    sode::ConceptionPrior prior{};
    for (int i = 0; i < 20; ++i) prior[static_cast<size_t>(i)] = 0.025;
    for (int i = 150; i < 170; ++i) prior[static_cast<size_t>(i)] = 0.025;

    for (const sode::GestationAgeRange r : {sode::GestationAgeRange{1, 1},
                                            sode::GestationAgeRange{150, 160},
                                            sode::GestationAgeRange{200, 300}}) {
        const auto res = sode::convolve_death_date(prior, r);
        const auto segs = sode::find_segments(res.calendar);
        const std::string tag = "[" + std::to_string(r.min_day) + "," +
                                std::to_string(r.max_day) + "]";
        expect(!segs.empty(), tag + " has runs", failed);
        expect(std::abs(sode::segments_mass(segs) - 1.0) < 1e-9, tag + " mass conserved", failed);
        expect(covers_support_once(res.calendar, segs), tag + " disjoint cover", failed);
        for (size_t i = 1; i < segs.size(); ++i) {
            expect(segs[i - 1].low_day < segs[i].low_day, tag + " sorted by low day", failed);
        }
    }

    const auto two = sode::find_segments(sode::convolve_death_date(prior, {1, 1}).calendar);
    expect(two.size() == 2, "two pulses at one age give two runs", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_wrapping_run();
    total += test_degenerate_calendars();
    total += test_convolved_calendars();

    if (total == 0) {
        std::cout << "\nAll segment tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
