#include "sode/interval.hpp"

#include <algorithm>

namespace sode {

IntervalReport classify_interval_query(size_t num_calendars, const Interval& interval) {
    if (interval.is_full_year()) {
        return num_calendars > 1 ? IntervalReport::SAME_DAY_ONLY
                                 : IntervalReport::NO_STATEMENT;
    }
    return num_calendars > 1 ? IntervalReport::SAME_DAY_AND_ALL_WITHIN
                             : IntervalReport::ALL_WITHIN_ONLY;
}

IntervalAnalysis analyze_interval(const std::vector<const ProbabilityCalendar*>& calendars,
                                  const Interval& interval) {
    IntervalAnalysis a;
    a.interval = interval;
    a.num_calendars = calendars.size();

    const bool has_null = std::any_of(calendars.begin(), calendars.end(),
                                      [](const ProbabilityCalendar* c) { return c == nullptr; });
    if (calendars.empty() || has_null) {
        a.status = Status::INVALID_SELECTION;
        return a;
    }
    if (!interval.valid()) {
        a.status = Status::INVALID_RANGE;
        return a;
    }

    a.report = classify_interval_query(calendars.size(), interval);
    if (a.report == IntervalReport::NO_STATEMENT) {
        a.status = Status::DEGENERATE_QUERY;
    }

    for_each_day(interval, [&](int d) {
        const size_t i = static_cast<size_t>(d - 1);
        double prod = 1.0;
        double lo = (*calendars.front())[i];
        double hi = lo;
        for (const ProbabilityCalendar* c : calendars) {
            const double p = (*c)[i];
            prod *= p;
            lo = std::min(lo, p);
            hi = std::max(hi, p);
        }
        a.product[i] = prod;
        a.minimum[i] = lo;
        a.maximum[i] = hi;
    });

    a.within.reserve(calendars.size());
    a.all_within_probability = 1.0;
    for (const ProbabilityCalendar* c : calendars) {
        const double m = interval_mass(*c, interval);
        a.within.push_back(m);
        a.all_within_probability *= m;
    }
    a.same_day_probability = interval_mass(a.product, interval);
    return a;
}

}  // namespace sode
