#pragma once

/**
 * @file report.hpp
 * @brief Human-readable, JSON and TSV renderings of session results.
 *
 * Interval reports follow the reporting rules of the analysis: a single
 * calendar states only the all-within probability, the whole year with
 * several calendars states only the same-day probability, and one calendar
 * against the whole year makes no statement.
 */

#include "sode/bootstrap.hpp"
#include "sode/interval.hpp"
#include "sode/session.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace sode {

// "Jun 1 - Aug 3"; a single-day segment prints one date.
std::string format_segment(const Segment& segment);

const char* provenance_to_string(Provenance provenance);

void print_entry(const Entry& entry, std::ostream& os);
void print_entries(const std::vector<Entry>& entries, std::ostream& os);
void print_entries_json(const std::vector<Entry>& entries, std::ostream& os);

void print_interval(const IntervalAnalysis& analysis,
                    const std::vector<size_t>& indices, std::ostream& os);
void print_interval_json(const IntervalAnalysis& analysis,
                         const std::vector<size_t>& indices, std::ostream& os);

void print_combination(const CombineResult& result, std::ostream& os);
void print_combinations_json(const std::vector<CombineResult>& results,
                             const Session& session, std::ostream& os);

// Tab-separated "element lower median upper ratios", humerus, radius, femur,
// tibia. Elements without a ratio become '#' comment lines, so the table
// loads back through load_size_ratios().
void print_ratios(const ElementRatios& ratios, std::ostream& os);
void print_ratios_json(const ElementRatios& ratios, std::ostream& os);

// Header "day\tdate\t<label>..." then one row per day of the year.
void write_calendar_tsv(const std::vector<Entry>& entries, std::ostream& os);

// Same, to a file. Throws std::runtime_error if it cannot be written.
void write_calendar_tsv(const std::vector<Entry>& entries, const std::string& path);

// One probability per row, offset 0 (June 1) first.
void write_prior(const ConceptionPrior& prior, std::ostream& os);

}  // namespace sode
