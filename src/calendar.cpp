#include "sode/calendar.hpp"

#include <algorithm>

namespace sode {

namespace {

constexpr std::array<int, 12> kMonthLengths = {31, 28, 31, 30, 31, 30,
                                               31, 31, 30, 31, 30, 31};

constexpr std::array<const char*, 12> kMonthNames = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

}  // namespace

const char* status_to_string(Status status) {
    switch (status) {
        case Status::OK: return "ok";
        case Status::INVALID_RANGE: return "invalid range";
        case Status::NORMALIZATION_FAILURE: return "normalization failure";
        case Status::EMPTY_INTERSECTION: return "empty intersection";
        case Status::DEGENERATE_QUERY: return "degenerate query";
        case Status::INVALID_SELECTION: return "invalid selection";
        case Status::OUT_OF_CALIBRATION: return "out of calibration";
    }
    return "unknown";
}

double calendar_mass(const ProbabilityCalendar& calendar) {
    double total = 0.0;
    for (double p : calendar) total += p;
    return total;
}

double interval_mass(const ProbabilityCalendar& calendar, const Interval& interval) {
    double total = 0.0;
    for_each_day(interval, [&](int d) { total += at_day(calendar, d); });
    return total;
}

size_t count_nonzero(const ProbabilityCalendar& calendar) {
    return static_cast<size_t>(std::count_if(calendar.begin(), calendar.end(),
                                             [](double p) { return p != 0.0; }));
}

int month_of_day(int day) {
    if (!is_valid_day(day)) return 0;
    int remaining = day;
    for (int m = 0; m < 12; ++m) {
        if (remaining <= kMonthLengths[m]) return m + 1;
        remaining -= kMonthLengths[m];
    }
    return 12;
}

int date_of_day(int day) {
    if (!is_valid_day(day)) return 0;
    int remaining = day;
    for (int m = 0; m < 12; ++m) {
        if (remaining <= kMonthLengths[m]) return remaining;
        remaining -= kMonthLengths[m];
    }
    return remaining;
}

const char* month_abbrev(int month) {
    if (month < 1 || month > 12) return "???";
    return kMonthNames[static_cast<size_t>(month - 1)];
}

std::string format_day(int day) {
    return std::string(month_abbrev(month_of_day(day))) + " " +
           std::to_string(date_of_day(day));
}

}  // namespace sode
