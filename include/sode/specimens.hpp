#pragma once
// Specimen tables feeding a session.
//
// Each data row is either
//   <element> <depth> [label...]       a measured diaphysis
//   range <min_day> <max_day> [label...] a gestation-age range given directly
// Rows are added to the session in file order, so row N becomes entry N.

#include "sode/gestation.hpp"
#include "sode/session.hpp"

#include <string>
#include <vector>

namespace sode {

struct SpecimenRow {
    std::string label;
    Element element = Element::UNKNOWN;
    double depth = 0.0;
    GestationAgeRange range;
    bool has_range = false;   // true for "range" rows
    size_t line = 0;
};

// Throws std::runtime_error on I/O errors and malformed rows.
std::vector<SpecimenRow> load_specimens(const std::string& path);

// Resolve and append every row. A depth row needs `resolver`; rows that cannot
// be turned into an entry throw std::runtime_error naming the row, so entry
// numbers always match row order.
void add_specimens(Session& session, const std::vector<SpecimenRow>& rows,
                   const GestationResolver* resolver);

}  // namespace sode
