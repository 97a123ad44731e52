#include "sode/segments.hpp"

#include <algorithm>

namespace sode {

namespace {

enum class ScanState { OUTSIDE_RUN, INSIDE_RUN };

// First day (0-based index) holding an exact zero, or -1.
int first_zero_index(const ProbabilityCalendar& calendar) {
    for (int i = 0; i < kDaysPerYear; ++i) {
        if (calendar[static_cast<size_t>(i)] == 0.0) return i;
    }
    return -1;
}

}  // namespace

std::vector<Segment> find_segments(const ProbabilityCalendar& calendar) {
    std::vector<Segment> segments;

    const int zero = first_zero_index(calendar);
    if (zero < 0) {
        segments.push_back({1, kDaysPerYear, calendar_mass(calendar)});
        return segments;
    }

    // Starting on a zero day, no run can straddle the scan boundary.
    ScanState state = ScanState::OUTSIDE_RUN;
    Segment current;
    int prev_idx = zero;
    for (int k = 0; k < kDaysPerYear; ++k) {
        const int idx = (zero + k) % kDaysPerYear;
        const double p = calendar[static_cast<size_t>(idx)];

        if (state == ScanState::OUTSIDE_RUN) {
            if (p != 0.0) {
                current = Segment{idx + 1, idx + 1, p};
                state = ScanState::INSIDE_RUN;
            }
        } else if (p != 0.0) {
            current.mass += p;
        } else {
            current.high_day = prev_idx + 1;
            segments.push_back(current);
            state = ScanState::OUTSIDE_RUN;
        }
        prev_idx = idx;
    }
    if (state == ScanState::INSIDE_RUN) {
        current.high_day = prev_idx + 1;
        segments.push_back(current);
    }

    std::sort(segments.begin(), segments.end(),
              [](const Segment& a, const Segment& b) { return a.low_day < b.low_day; });
    return segments;
}

double segments_mass(const std::vector<Segment>& segments) {
    double total = 0.0;
    for (const auto& s : segments) total += s.mass;
    return total;
}

}  // namespace sode
