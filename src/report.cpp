#include "sode/report.hpp"
#include "sode/version.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace sode {

namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Restores the caller's float format and precision on scope exit.
class FormatGuard {
public:
    explicit FormatGuard(std::ostream& os)
        : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~FormatGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

    FormatGuard(const FormatGuard&) = delete;
    FormatGuard& operator=(const FormatGuard&) = delete;

private:
    std::ostream& os_;
    std::ios::fmtflags flags_;
    std::streamsize precision_;
};

// Elements in report order.
constexpr Element kReportOrder[] = {Element::HUMERUS, Element::RADIUS, Element::FEMUR,
                                    Element::TIBIA};

const char* report_kind(IntervalReport report) {
    switch (report) {
        case IntervalReport::NO_STATEMENT: return "none";
        case IntervalReport::SAME_DAY_ONLY: return "same_day";
        case IntervalReport::ALL_WITHIN_ONLY: return "all_within";
        case IntervalReport::SAME_DAY_AND_ALL_WITHIN: return "same_day_and_all_within";
    }
    return "none";
}

bool states_same_day(IntervalReport r) {
    return r == IntervalReport::SAME_DAY_ONLY || r == IntervalReport::SAME_DAY_AND_ALL_WITHIN;
}

bool states_all_within(IntervalReport r) {
    return r == IntervalReport::ALL_WITHIN_ONLY || r == IntervalReport::SAME_DAY_AND_ALL_WITHIN;
}

std::string format_interval(const Interval& interval) {
    return format_day(interval.start_day) + " - " + format_day(interval.end_day);
}

void write_index_list(const std::vector<size_t>& indices, std::ostream& os) {
    os << "[";
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) os << ", ";
        os << indices[i];
    }
    os << "]";
}

void write_entry_json(const Entry& e, std::ostream& os, const char* indent) {
    FormatGuard guard(os);
    os << indent << "{\n";
    os << indent << "  \"index\": " << e.index << ",\n";
    os << indent << "  \"label\": \"" << json_escape(e.label) << "\",\n";
    os << indent << "  \"provenance\": \"" << provenance_to_string(e.provenance) << "\",\n";
    os << indent << "  \"sources\": ";
    write_index_list(e.sources, os);
    os << ",\n";
    os << indent << "  \"min_day\": " << e.range.min_day << ",\n";
    os << indent << "  \"max_day\": " << e.range.max_day << ",\n";
    os << indent << "  \"segments\": [";
    for (size_t i = 0; i < e.segments.size(); ++i) {
        const Segment& s = e.segments[i];
        os << (i > 0 ? ",\n" : "\n");
        os << indent << "    {\"low_day\": " << s.low_day
           << ", \"high_day\": " << s.high_day
           << ", \"from\": \"" << format_day(s.low_day) << "\""
           << ", \"to\": \"" << format_day(s.high_day) << "\""
           << ", \"mass\": " << std::setprecision(6) << s.mass << "}";
    }
    if (!e.segments.empty()) os << "\n" << indent << "  ";
    os << "]\n";
    os << indent << "}";
}

}  // namespace

std::string format_segment(const Segment& segment) {
    if (segment.low_day == segment.high_day) return format_day(segment.low_day);
    return format_day(segment.low_day) + " - " + format_day(segment.high_day);
}

const char* provenance_to_string(Provenance provenance) {
    return provenance == Provenance::COMBINED ? "combined" : "measured";
}

void print_entry(const Entry& entry, std::ostream& os) {
    os << "Entry " << entry.index << ": " << entry.label << "\n";
    os << "  Gestation age:  " << entry.range.min_day << " - " << entry.range.max_day
       << " days\n";
    if (entry.provenance == Provenance::COMBINED) {
        os << "  Combined from:  entries ";
        write_index_list(entry.sources, os);
        os << "\n";
    }
    os << "  Death period:\n";
    FormatGuard guard(os);
    os << std::fixed << std::setprecision(4);
    for (const auto& s : entry.segments) {
        os << "    " << std::left << std::setw(18) << format_segment(s) << std::right
           << " p = " << s.mass << "  (" << s.length() << " days)\n";
    }
}

void print_entries(const std::vector<Entry>& entries, std::ostream& os) {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) os << "\n";
        print_entry(entries[i], os);
    }
}

void print_entries_json(const std::vector<Entry>& entries, std::ostream& os) {
    os << "{\n";
    os << "  \"version\": \"" << SODE_VERSION << "\",\n";
    os << "  \"entries\": [";
    for (size_t i = 0; i < entries.size(); ++i) {
        os << (i > 0 ? ",\n" : "\n");
        write_entry_json(entries[i], os, "    ");
    }
    if (!entries.empty()) os << "\n  ";
    os << "]\n";
    os << "}\n";
}

void print_interval(const IntervalAnalysis& analysis,
                    const std::vector<size_t>& indices, std::ostream& os) {
    os << "Interval " << format_interval(analysis.interval)
       << " (" << analysis.interval.length() << " days), entries ";
    write_index_list(indices, os);
    os << "\n";

    if (!analysis.ok()) {
        os << "  Error: " << status_to_string(analysis.status) << "\n";
        return;
    }
    if (analysis.report == IntervalReport::NO_STATEMENT) {
        os << "  One entry against the whole year: nothing to test.\n";
        return;
    }

    std::vector<std::pair<std::string, double>> lines;
    if (states_all_within(analysis.report)) {
        for (size_t k = 0; k < analysis.within.size() && k < indices.size(); ++k) {
            lines.emplace_back("P(entry " + std::to_string(indices[k]) + " within)",
                               analysis.within[k]);
        }
        lines.emplace_back("P(all within)", analysis.all_within_probability);
    }
    if (states_same_day(analysis.report)) {
        lines.emplace_back("P(same day)", analysis.same_day_probability);
    }

    size_t width = 0;
    for (const auto& line : lines) width = std::max(width, line.first.size());

    FormatGuard guard(os);
    os << std::fixed << std::setprecision(4);
    for (const auto& line : lines) {
        os << "  " << std::left << std::setw(static_cast<int>(width)) << line.first
           << std::right << " = " << line.second << "\n";
    }
}

void print_interval_json(const IntervalAnalysis& analysis,
                         const std::vector<size_t>& indices, std::ostream& os) {
    os << "{\n";
    os << "  \"status\": \"" << status_to_string(analysis.status) << "\",\n";
    os << "  \"entries\": ";
    write_index_list(indices, os);
    os << ",\n";
    os << "  \"start_day\": " << analysis.interval.start_day << ",\n";
    os << "  \"end_day\": " << analysis.interval.end_day << ",\n";
    os << "  \"report\": \"" << report_kind(analysis.report) << "\"";
    FormatGuard guard(os);
    if (analysis.ok()) {
        os << std::setprecision(10);
        if (states_all_within(analysis.report)) {
            os << ",\n  \"within\": [";
            for (size_t k = 0; k < analysis.within.size(); ++k) {
                if (k > 0) os << ", ";
                os << analysis.within[k];
            }
            os << "],\n  \"all_within_probability\": " << analysis.all_within_probability;
        }
        if (states_same_day(analysis.report)) {
            os << ",\n  \"same_day_probability\": " << analysis.same_day_probability;
        }
    }
    os << "\n}\n";
}

void print_combination(const CombineResult& result, std::ostream& os) {
    os << "Combine entries ";
    write_index_list(result.sources, os);
    os << ": ";
    if (result.ok()) {
        os << "new entry " << result.index << ", gestation age "
           << result.range.min_day << " - " << result.range.max_day << " days\n";
    } else if (result.empty_intersection()) {
        os << "ranges do not overlap (" << result.range.min_day << " > "
           << result.range.max_day << "); the entries cannot come from one individual\n";
    } else {
        os << status_to_string(result.status) << "\n";
    }
}

void print_combinations_json(const std::vector<CombineResult>& results,
                             const Session& session, std::ostream& os) {
    os << "{\n";
    os << "  \"version\": \"" << SODE_VERSION << "\",\n";
    os << "  \"combinations\": [";
    for (size_t i = 0; i < results.size(); ++i) {
        const CombineResult& r = results[i];
        os << (i > 0 ? ",\n" : "\n");
        os << "    {\"sources\": ";
        write_index_list(r.sources, os);
        os << ", \"status\": \"" << status_to_string(r.status) << "\""
           << ", \"min_day\": " << r.range.min_day
           << ", \"max_day\": " << r.range.max_day
           << ", \"index\": " << r.index << "}";
    }
    if (!results.empty()) os << "\n  ";
    os << "],\n";
    os << "  \"entries\": [";
    for (size_t i = 0; i < session.entries().size(); ++i) {
        os << (i > 0 ? ",\n" : "\n");
        write_entry_json(session.entries()[i], os, "    ");
    }
    if (session.size() > 0) os << "\n  ";
    os << "]\n";
    os << "}\n";
}

void print_ratios(const ElementRatios& ratios, std::ostream& os) {
    FormatGuard guard(os);
    os << "# element\tlower\tmedian\tupper\tratios\n";
    os << std::fixed << std::setprecision(4);
    for (Element el : kReportOrder) {
        const RatioQuantiles& q = ratios[static_cast<size_t>(el)];
        if (!q.ok()) {
            os << "# " << element_to_string(el) << ": " << status_to_string(q.status) << "\n";
            continue;
        }
        os << element_to_string(el) << '\t' << q.lower << '\t' << q.median << '\t'
           << q.upper << '\t' << q.num_ratios << '\n';
    }
}

void print_ratios_json(const ElementRatios& ratios, std::ostream& os) {
    FormatGuard guard(os);
    os << std::setprecision(10);
    os << "{\n";
    os << "  \"version\": \"" << SODE_VERSION << "\",\n";
    os << "  \"elements\": [";
    bool first = true;
    for (Element el : kReportOrder) {
        const RatioQuantiles& q = ratios[static_cast<size_t>(el)];
        os << (first ? "\n" : ",\n");
        first = false;
        os << "    {\"element\": \"" << element_to_string(el) << "\""
           << ", \"status\": \"" << status_to_string(q.status) << "\""
           << ", \"num_ratios\": " << q.num_ratios;
        if (q.ok()) {
            os << ", \"q025\": " << q.lower << ", \"q500\": " << q.median
               << ", \"q975\": " << q.upper;
        }
        os << "}";
    }
    os << "\n  ]\n";
    os << "}\n";
}

void write_calendar_tsv(const std::vector<Entry>& entries, std::ostream& os) {
    os << "day\tdate";
    for (const auto& e : entries) os << "\tentry" << e.index;
    os << "\n";
    FormatGuard guard(os);
    os << std::setprecision(12);
    for (int d = 1; d <= kDaysPerYear; ++d) {
        os << d << '\t' << format_day(d);
        for (const auto& e : entries) os << '\t' << at_day(e.calendar, d);
        os << '\n';
    }
}

void write_calendar_tsv(const std::vector<Entry>& entries, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    write_calendar_tsv(entries, ofs);
    if (!ofs) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

void write_prior(const ConceptionPrior& prior, std::ostream& os) {
    os << "# offset\tdate\tprobability\n";
    FormatGuard guard(os);
    os << std::setprecision(12);
    for (int i = 0; i < kPriorLength; ++i) {
        const int day = (kCycleStartDay - 1 + i) % kDaysPerYear + 1;
        os << i << '\t' << format_day(day) << '\t' << prior[static_cast<size_t>(i)] << '\n';
    }
}

}  // namespace sode
