#pragma once

/**
 * @file session.hpp
 * @brief Entry collection for one analysis session.
 *
 * A session holds the conception prior chosen for the analysis and the
 * ordered, append-only list of entries built from it. Entries are numbered
 * from 1 in insertion order and never change after they are added; combining
 * entries appends a new one. Sessions share nothing, so independent analyses
 * each create their own.
 */

#include "sode/calendar.hpp"
#include "sode/interval.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sode {

enum class Provenance : uint8_t { MEASURED, COMBINED };

struct Entry {
    size_t index = 0;                 // 1-based position in the session
    std::string label;
    GestationAgeRange range;
    ProbabilityCalendar calendar{};
    std::vector<Segment> segments;
    Provenance provenance = Provenance::MEASURED;
    std::vector<size_t> sources;      // combined entries: sorted source indices
};

struct AddResult {
    Status status = Status::OK;
    size_t index = 0;                 // 0 when nothing was added

    bool ok() const { return status == Status::OK; }
};

struct CombineResult {
    Status status = Status::OK;
    GestationAgeRange range;          // intersected range; min > max when empty
    ProbabilityCalendar calendar{};   // all zero unless ok()
    std::vector<size_t> sources;
    size_t index = 0;                 // new entry, 0 when nothing was added

    bool ok() const { return status == Status::OK; }
    bool empty_intersection() const { return status == Status::EMPTY_INTERSECTION; }
};

class Session {
public:
    explicit Session(const ConceptionPrior& prior);

    const ConceptionPrior& prior() const { return prior_; }

    // Convolve the prior over `range` and append the result.
    AddResult add_measured(const GestationAgeRange& range, std::string label = {});

    // Fuse two or more distinct entries (duplicates in `indices` are ignored).
    // A non-overlapping set reports EMPTY_INTERSECTION and appends nothing.
    CombineResult combine(const std::vector<size_t>& indices);

    // Interval analysis over the selected entries, in the order given.
    IntervalAnalysis analyze(const std::vector<size_t>& indices,
                             const Interval& interval) const;

    bool has_entry(size_t index) const { return index >= 1 && index <= entries_.size(); }

    // Throws std::out_of_range for an unknown index.
    const Entry& entry(size_t index) const;

    size_t size() const { return entries_.size(); }
    const std::vector<Entry>& entries() const { return entries_; }

private:
    size_t append(Entry entry);

    ConceptionPrior prior_;
    std::vector<Entry> entries_;
};

std::string combined_label(const std::vector<size_t>& sources);

}  // namespace sode
