#include "sode/table_reader.hpp"

#include <zlib.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace sode {

namespace {

constexpr unsigned GZBUF_SIZE = 256 * 1024;
constexpr int LINE_CHUNK = 4096;

}  // namespace

struct TableReader::Impl {
    std::string path;
    gzFile gz = nullptr;
    size_t line_no = 0;
    std::string line;

    // Read one physical line of any length; false at EOF.
    bool read_line() {
        line.clear();
        char buf[LINE_CHUNK];
        while (gzgets(gz, buf, LINE_CHUNK) != nullptr) {
            line.append(buf);
            if (!line.empty() && line.back() == '\n') break;
        }
        if (line.empty()) {
            int err = Z_OK;
            const char* msg = gzerror(gz, &err);
            if (err != Z_OK && err != Z_STREAM_END) {
                throw std::runtime_error("Read error in " + path + ": " + msg);
            }
            return false;
        }
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        ++line_no;
        return true;
    }
};

TableReader::TableReader(const std::string& path) : impl_(std::make_unique<Impl>()) {
    impl_->path = path;
    impl_->gz = gzopen(path.c_str(), "rb");
    if (!impl_->gz) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    gzbuffer(impl_->gz, GZBUF_SIZE);
}

TableReader::~TableReader() {
    if (impl_ && impl_->gz) {
        gzclose(impl_->gz);
        impl_->gz = nullptr;
    }
}

bool TableReader::next_row(std::vector<std::string>& fields) {
    while (impl_->read_line()) {
        size_t first = impl_->line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        if (impl_->line[first] == '#') continue;
        fields = split_fields(impl_->line);
        return true;
    }
    fields.clear();
    return false;
}

const std::string& TableReader::path() const { return impl_->path; }

size_t TableReader::line_number() const { return impl_->line_no; }

std::string TableReader::where() const {
    return impl_->path + ":" + std::to_string(impl_->line_no);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find_first_not_of(" \t", pos);
        if (start == std::string::npos) break;
        size_t end = line.find_first_of(" \t", start);
        if (end == std::string::npos) end = line.size();
        out.push_back(line.substr(start, end - start));
        pos = end;
    }
    return out;
}

double parse_double_field(const std::string& field, const TableReader& reader) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(field.c_str(), &end);
    if (field.empty() || end != field.c_str() + field.size() || errno == ERANGE ||
        !std::isfinite(v)) {
        throw std::runtime_error(reader.where() + ": invalid number '" + field + "'");
    }
    return v;
}

int parse_int_field(const std::string& field, const TableReader& reader) {
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(field.c_str(), &end, 10);
    if (field.empty() || end != field.c_str() + field.size() || errno == ERANGE ||
        v < -2147483647L || v > 2147483647L) {
        throw std::runtime_error(reader.where() + ": invalid integer '" + field + "'");
    }
    return static_cast<int>(v);
}

}  // namespace sode
