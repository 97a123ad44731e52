#pragma once
// Line-oriented reader for whitespace/tab separated tables.
//
// Plain and gzip-compressed files are read through the same zlib handle
// (gzopen passes uncompressed input through unchanged). Blank lines and lines
// starting with '#' are skipped.

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sode {

class TableReader {
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit TableReader(const std::string& path);
    ~TableReader();

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    // Next data row split on tabs/spaces. Returns false at end of file.
    bool next_row(std::vector<std::string>& fields);

    const std::string& path() const;
    size_t line_number() const;

    // "<path>:<line>" for error messages.
    std::string where() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Strict numeric field parsing; throws std::runtime_error naming the row.
double parse_double_field(const std::string& field, const TableReader& reader);
int parse_int_field(const std::string& field, const TableReader& reader);

// Split on any run of tabs/spaces (also used for CLI list values).
std::vector<std::string> split_fields(const std::string& line);

}  // namespace sode
