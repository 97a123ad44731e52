#include "sode/cycle_mapper.hpp"

namespace sode {

const CycleMapper& CycleMapper::instance() {
    static const CycleMapper mapper;
    return mapper;
}

CycleMapper::CycleMapper() {
    for (int p = 0; p < kCycleLength; ++p) {
        const int day = (kCycleStartDay - 1 + p) % kDaysPerYear + 1;
        day_[static_cast<size_t>(p)] = static_cast<int16_t>(day);

        auto& slot = count_[static_cast<size_t>(day - 1)];
        positions_[static_cast<size_t>(day - 1)][slot] = static_cast<int16_t>(p);
        ++slot;
    }
}

ProbabilityCalendar CycleMapper::fold(const CycleArray& cycle) const {
    ProbabilityCalendar out{};
    for (int d = 1; d <= kDaysPerYear; ++d) {
        const auto& pos = positions_[static_cast<size_t>(d - 1)];
        double v = cycle[static_cast<size_t>(pos[0])];
        if (count_[static_cast<size_t>(d - 1)] > 1) {
            v += cycle[static_cast<size_t>(pos[1])];
        }
        out[static_cast<size_t>(d - 1)] = v;
    }
    return out;
}

}  // namespace sode
