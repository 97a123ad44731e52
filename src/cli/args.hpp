#ifndef SODE_CLI_ARGS_HPP
#define SODE_CLI_ARGS_HPP

#include "sode/calendar.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sode {
namespace cli {

// Thrown by parse_args to end the command: code 0 after --help, 1 on errors.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = {})
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

enum class Command { ESTIMATE, INTERVAL, COMBINE, PRIOR, RATIO };

const char* command_name(Command command);

struct Options {
    Command command = Command::ESTIMATE;

    // Session inputs (estimate / interval / combine)
    std::string prior_file;
    std::string specimens_file;
    std::string calibration_dir;
    double measurement_error = 0.225;  // mm
    std::string size_ratios_file;      // per-element upper growth envelope ratios

    // interval
    std::vector<size_t> entries;
    Interval interval;

    // combine: each group is one combination, run in order
    std::vector<std::vector<size_t>> combinations;

    // prior
    std::string counts_file;
    bool smooth = false;
    int window = 21;
    double alpha = 2.5;

    // ratio
    std::string lengths_file;
    int resamples = 10000;
    uint64_t seed = 10;
    int num_threads = 0;               // 0 = SODE_THREADS or OpenMP default

    // Output
    std::string output_file;
    std::string calendar_out;
    bool json = false;
    bool verbose = false;
};

void print_usage(Command command, const char* program_name);

// Parse one subcommand's argv (argv[0] is the subcommand name).
// Throws ParseArgsExit(0) after printing --help, ParseArgsExit(1, msg) on errors.
Options parse_args(Command command, int argc, char* argv[]);

// "1,3,4" -> {1, 3, 4}. Indices are 1-based.
std::vector<size_t> parse_index_list(const std::string& value);

// "330,40" -> Interval{330, 40}. Days must lie in 1..365; anything else,
// including values beyond the range of long, throws ParseArgsExit(1).
Interval parse_interval(const std::string& value);

// "1,2;3,4" -> {{1, 2}, {3, 4}}.
std::vector<std::vector<size_t>> parse_combination_groups(const std::string& value);

}  // namespace cli
}  // namespace sode

#endif  // SODE_CLI_ARGS_HPP
