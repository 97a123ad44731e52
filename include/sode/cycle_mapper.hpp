#pragma once
// Extended reproductive-cycle index -> calendar day.
//
// The cycle runs from June 1 (earliest conception) through December 31 of
// the following year: 579 positions, 0-based here. Positions 0-213 and
// 365-578 both land on June 1 .. December 31, so those calendar days receive
// two contributions when a cycle array is folded onto the year.

#include "sode/calendar.hpp"

#include <array>
#include <cstdint>

namespace sode {

class CycleMapper {
public:
    static const CycleMapper& instance();

    // Calendar day (1-365) for a 0-based cycle position.
    int day_of_year(int position) const {
        return day_[static_cast<size_t>(position)];
    }

    // Number of cycle positions (1 or 2) that map to a calendar day.
    int multiplicity(int day) const {
        return count_[static_cast<size_t>(day - 1)];
    }

    // k-th (0-based) cycle position mapping to a calendar day, ascending.
    int position(int day, int k) const {
        return positions_[static_cast<size_t>(day - 1)][static_cast<size_t>(k)];
    }

    // Sum every cycle position onto its calendar day. Days whose positions
    // all hold exact zeros stay exactly zero.
    ProbabilityCalendar fold(const CycleArray& cycle) const;

private:
    CycleMapper();

    std::array<int16_t, kCycleLength> day_{};
    std::array<std::array<int16_t, 2>, kDaysPerYear> positions_{};
    std::array<uint8_t, kDaysPerYear> count_{};
};

}  // namespace sode
