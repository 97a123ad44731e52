#include "args.hpp"
#include "sode/version.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace sode {
namespace cli {

namespace {

std::vector<std::string> split_on(const std::string& value, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = value.find(sep, start);
        parts.push_back(value.substr(start, pos == std::string::npos ? std::string::npos
                                                                      : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

// Whole value must be an integer in [lo, hi]; out-of-range input is rejected
// before any narrowing.
long parse_long(const std::string& flag, const std::string& value, long lo, long hi) {
    if (value.empty()) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size()) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
    if (errno == ERANGE || parsed < lo || parsed > hi) {
        throw ParseArgsExit(1, "Error: " + flag + " must lie in " + std::to_string(lo) +
                                   ".." + std::to_string(hi) + ": " + value);
    }
    return parsed;
}

int parse_int(const std::string& flag, const std::string& value, int lo,
              int hi = std::numeric_limits<int>::max()) {
    return static_cast<int>(parse_long(flag, value, lo, hi));
}

double parse_real(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size()) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
    return parsed;
}

bool uses_session(Command c) {
    return c == Command::ESTIMATE || c == Command::INTERVAL || c == Command::COMBINE;
}

}  // namespace

const char* command_name(Command command) {
    switch (command) {
        case Command::ESTIMATE: return "estimate";
        case Command::INTERVAL: return "interval";
        case Command::COMBINE: return "combine";
        case Command::PRIOR: return "prior";
        case Command::RATIO: return "ratio";
    }
    return "estimate";
}

void print_usage(Command command, const char* program_name) {
    std::cout << "SODE v" << SODE_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " " << command_name(command) << " [options]\n\n";

    if (uses_session(command)) {
        std::cout << "Input:\n";
        std::cout << "  --prior <file>           Conception prior, 245 values from June 1 (.gz ok)\n";
        std::cout << "  --specimens <file>       Rows 'element depth [label]' or 'range min max [label]'\n";
        std::cout << "  --calibration <dir>      depth_models.tsv + envelope_<element>.tsv\n";
        std::cout << "  --error <mm>             Depth measurement error (default: 0.225)\n";
        std::cout << "  --size-ratios <file>     Per-element upper-envelope ratios (from 'sode ratio')\n";
    }
    if (command == Command::INTERVAL) {
        std::cout << "\nInterval:\n";
        std::cout << "  --entries <list>         Entries to test, e.g. 1,3\n";
        std::cout << "  --interval <s,e>         Days of year; s > e wraps through Jan 1\n";
    } else if (command == Command::COMBINE) {
        std::cout << "\nCombine:\n";
        std::cout << "  --entries <groups>       Entries believed to be one individual,\n";
        std::cout << "                           e.g. 1,2 or 1,2;3,4 (run in order)\n";
    } else if (command == Command::PRIOR) {
        std::cout << "Input:\n";
        std::cout << "  --counts <file>          245 observation counts from June 1 (.gz ok)\n";
        std::cout << "  --smooth                 Gaussian smoothing before normalizing\n";
        std::cout << "  --window <int>           Smoothing window in days (default: 21)\n";
        std::cout << "  --alpha <x>              Smoothing kernel shape (default: 2.5)\n";
    } else if (command == Command::RATIO) {
        std::cout << "Input:\n";
        std::cout << "  --lengths <file>         Rows 'element side form sex length'\n";
        std::cout << "                           (form: modern|ancient; most common side per element)\n";
        std::cout << "  --resamples <int>        Bootstrap resamples (default: 10000)\n";
        std::cout << "  --seed <int>             Random seed (default: 10)\n";
        std::cout << "  -t, --threads <int>      Threads (default: $SODE_THREADS or all)\n";
    }

    std::cout << "\nOutput:\n";
    std::cout << "  -o, --output <file>      Write to file instead of stdout\n";
    if (uses_session(command)) {
        std::cout << "  --calendar-out <file>    Daily probabilities of every entry (TSV)\n";
    }
    if (command != Command::PRIOR) {
        std::cout << "  --json                   Output as JSON\n";
    }
    std::cout << "  -v, --verbose            Progress on stderr\n";
    std::cout << "  -h, --help               Show this help message\n";
}

std::vector<size_t> parse_index_list(const std::string& value) {
    std::vector<size_t> out;
    for (const auto& part : split_on(value, ',')) {
        out.push_back(static_cast<size_t>(
            parse_long("--entries", part, 1, std::numeric_limits<long>::max())));
    }
    return out;
}

Interval parse_interval(const std::string& value) {
    const auto parts = split_on(value, ',');
    if (parts.size() != 2) {
        throw ParseArgsExit(1, "Error: --interval expects <start>,<end>: " + value);
    }
    Interval iv;
    iv.start_day = parse_int("--interval", parts[0], 1, kDaysPerYear);
    iv.end_day = parse_int("--interval", parts[1], 1, kDaysPerYear);
    return iv;
}

std::vector<std::vector<size_t>> parse_combination_groups(const std::string& value) {
    std::vector<std::vector<size_t>> groups;
    for (const auto& group : split_on(value, ';')) {
        groups.push_back(parse_index_list(group));
    }
    return groups;
}

Options parse_args(Command command, int argc, char* argv[]) {
    Options opts;
    opts.command = command;
    bool have_interval = false;
    std::string entries_value;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(command, "sode");
            throw ParseArgsExit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--json" && command != Command::PRIOR) {
            opts.json = true;
        } else if (uses_session(command) && arg == "--prior") {
            opts.prior_file = require_value(arg);
        } else if (uses_session(command) && arg == "--specimens") {
            opts.specimens_file = require_value(arg);
        } else if (uses_session(command) && arg == "--calibration") {
            opts.calibration_dir = require_value(arg);
        } else if (uses_session(command) && arg == "--calendar-out") {
            opts.calendar_out = require_value(arg);
        } else if (uses_session(command) && arg == "--error") {
            opts.measurement_error = parse_real(arg, require_value(arg));
            if (opts.measurement_error < 0.0) {
                throw ParseArgsExit(1, "Error: --error must be >= 0");
            }
        } else if (uses_session(command) && arg == "--size-ratios") {
            opts.size_ratios_file = require_value(arg);
        } else if ((command == Command::INTERVAL || command == Command::COMBINE) &&
                   arg == "--entries") {
            entries_value = require_value(arg);
        } else if (command == Command::INTERVAL && arg == "--interval") {
            opts.interval = parse_interval(require_value(arg));
            have_interval = true;
        } else if (command == Command::PRIOR && arg == "--counts") {
            opts.counts_file = require_value(arg);
        } else if (command == Command::PRIOR && arg == "--smooth") {
            opts.smooth = true;
        } else if (command == Command::PRIOR && arg == "--window") {
            opts.window = parse_int(arg, require_value(arg), 1, kPriorLength);
        } else if (command == Command::PRIOR && arg == "--alpha") {
            opts.alpha = parse_real(arg, require_value(arg));
            if (!(opts.alpha > 0.0)) {
                throw ParseArgsExit(1, "Error: --alpha must be > 0");
            }
        } else if (command == Command::RATIO && arg == "--lengths") {
            opts.lengths_file = require_value(arg);
        } else if (command == Command::RATIO && arg == "--resamples") {
            opts.resamples = parse_int(arg, require_value(arg), 1);
        } else if (command == Command::RATIO && arg == "--seed") {
            opts.seed = static_cast<uint64_t>(
                parse_long(arg, require_value(arg), 0, std::numeric_limits<long>::max()));
        } else if (command == Command::RATIO && (arg == "-t" || arg == "--threads")) {
            opts.num_threads = parse_int(arg, require_value(arg), 1);
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (uses_session(command)) {
        if (opts.prior_file.empty()) {
            throw ParseArgsExit(1, "Error: No prior file specified (--prior)");
        }
        if (opts.specimens_file.empty()) {
            throw ParseArgsExit(1, "Error: No specimen table specified (--specimens)");
        }
        if (!opts.size_ratios_file.empty() && opts.calibration_dir.empty()) {
            throw ParseArgsExit(1, "Error: --size-ratios needs --calibration");
        }
    }
    if (command == Command::INTERVAL) {
        if (entries_value.empty()) {
            throw ParseArgsExit(1, "Error: --entries is required");
        }
        opts.entries = parse_index_list(entries_value);
        if (!have_interval) opts.interval = Interval::full_year();
    } else if (command == Command::COMBINE) {
        if (entries_value.empty()) {
            throw ParseArgsExit(1, "Error: --entries is required");
        }
        opts.combinations = parse_combination_groups(entries_value);
    } else if (command == Command::PRIOR && opts.counts_file.empty()) {
        throw ParseArgsExit(1, "Error: No counts file specified (--counts)");
    } else if (command == Command::RATIO && opts.lengths_file.empty()) {
        throw ParseArgsExit(1, "Error: No lengths file specified (--lengths)");
    }

    return opts;
}

}  // namespace cli
}  // namespace sode
