#include "sode/session.hpp"
#include "sode/combined.hpp"
#include "sode/convolver.hpp"
#include "sode/segments.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sode {

namespace {

// Sorted, de-duplicated copy of a selection.
std::vector<size_t> unique_sorted(std::vector<size_t> indices) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

}  // namespace

std::string combined_label(const std::vector<size_t>& sources) {
    std::string label = "combined [entries ";
    for (size_t i = 0; i < sources.size(); ++i) {
        if (i > 0) label += ", ";
        label += std::to_string(sources[i]);
    }
    label += "]";
    return label;
}

Session::Session(const ConceptionPrior& prior) : prior_(prior) {}

size_t Session::append(Entry entry) {
    entry.index = entries_.size() + 1;
    entry.segments = find_segments(entry.calendar);
    entries_.push_back(std::move(entry));
    return entries_.back().index;
}

AddResult Session::add_measured(const GestationAgeRange& range, std::string label) {
    AddResult result;
    ConvolutionResult conv = convolve_death_date(prior_, range);
    result.status = conv.status;
    if (!conv.ok()) return result;

    Entry e;
    e.label = label.empty() ? "entry " + std::to_string(entries_.size() + 1)
                            : std::move(label);
    e.range = range;
    e.calendar = conv.calendar;
    e.provenance = Provenance::MEASURED;
    result.index = append(std::move(e));
    return result;
}

CombineResult Session::combine(const std::vector<size_t>& indices) {
    CombineResult result;
    result.sources = unique_sorted(indices);

    const bool all_known = std::all_of(result.sources.begin(), result.sources.end(),
                                       [this](size_t i) { return has_entry(i); });
    if (result.sources.size() < 2 || !all_known) {
        result.status = Status::INVALID_SELECTION;
        return result;
    }

    std::vector<GestationAgeRange> ranges;
    ranges.reserve(result.sources.size());
    for (size_t i : result.sources) ranges.push_back(entry(i).range);

    CombinedEstimate est = estimate_combined(prior_, ranges);
    result.status = est.status;
    result.range = est.range;
    if (!est.ok()) return result;

    result.calendar = est.calendar;

    Entry e;
    e.label = combined_label(result.sources);
    e.range = est.range;
    e.calendar = est.calendar;
    e.provenance = Provenance::COMBINED;
    e.sources = result.sources;
    result.index = append(std::move(e));
    return result;
}

IntervalAnalysis Session::analyze(const std::vector<size_t>& indices,
                                  const Interval& interval) const {
    std::vector<const ProbabilityCalendar*> calendars;
    calendars.reserve(indices.size());
    for (size_t i : indices) {
        if (!has_entry(i)) {
            IntervalAnalysis bad;
            bad.status = Status::INVALID_SELECTION;
            bad.interval = interval;
            bad.num_calendars = indices.size();
            return bad;
        }
        calendars.push_back(&entries_[i - 1].calendar);
    }
    return analyze_interval(calendars, interval);
}

const Entry& Session::entry(size_t index) const {
    if (!has_entry(index)) {
        throw std::out_of_range("No entry " + std::to_string(index) + " (session has " +
                                std::to_string(entries_.size()) + " entries)");
    }
    return entries_[index - 1];
}

}  // namespace sode
