#include "sode/specimens.hpp"
#include "sode/table_reader.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sode {

namespace {

std::string join_label(const std::vector<std::string>& fields, size_t from) {
    std::string out;
    for (size_t i = from; i < fields.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += fields[i];
    }
    return out;
}

std::string depth_label(const SpecimenRow& row) {
    std::ostringstream oss;
    oss << element_to_string(row.element) << " depth "
        << std::fixed << std::setprecision(2) << row.depth;
    return oss.str();
}

}  // namespace

std::vector<SpecimenRow> load_specimens(const std::string& path) {
    TableReader reader(path);
    std::vector<SpecimenRow> rows;
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        SpecimenRow row;
        row.line = reader.line_number();
        if (fields[0] == "range") {
            if (fields.size() < 3) {
                throw std::runtime_error(reader.where() + ": expected 'range min max'");
            }
            row.range.min_day = parse_int_field(fields[1], reader);
            row.range.max_day = parse_int_field(fields[2], reader);
            row.has_range = true;
            row.label = join_label(fields, 3);
        } else {
            if (fields.size() < 2) {
                throw std::runtime_error(reader.where() + ": expected 'element depth'");
            }
            row.element = element_from_string(fields[0]);
            if (row.element == Element::UNKNOWN) {
                throw std::runtime_error(reader.where() + ": unknown element '" +
                                         fields[0] + "'");
            }
            row.depth = parse_double_field(fields[1], reader);
            row.label = join_label(fields, 2);
            if (row.label.empty()) row.label = depth_label(row);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void add_specimens(Session& session, const std::vector<SpecimenRow>& rows,
                   const GestationResolver* resolver) {
    for (const auto& row : rows) {
        GestationAgeRange range = row.range;
        if (!row.has_range) {
            if (!resolver) {
                throw std::runtime_error("Specimen on line " + std::to_string(row.line) +
                                         " needs a calibration directory");
            }
            const GestationEstimate est = resolver->resolve(row.element, row.depth);
            if (!est.ok()) {
                std::ostringstream msg;
                msg << "Specimen on line " << row.line << " (" << element_to_string(row.element)
                    << ", depth " << row.depth << "): " << status_to_string(est.status);
                if (auto lim = resolver->depth_limits(row.element)) {
                    msg << "; measurable depths " << std::fixed << std::setprecision(2)
                        << lim->min_depth << " - " << lim->max_depth;
                }
                throw std::runtime_error(msg.str());
            }
            range = est.range;
        }

        const AddResult added = session.add_measured(range, row.label);
        if (!added.ok()) {
            throw std::runtime_error("Specimen on line " + std::to_string(row.line) +
                                     ": range [" + std::to_string(range.min_day) + ", " +
                                     std::to_string(range.max_day) + "] " +
                                     status_to_string(added.status));
        }
    }
}

}  // namespace sode
