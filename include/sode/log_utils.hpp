#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace sode {
namespace log_utils {

using Clock = std::chrono::steady_clock;

// "850 ms", "2.4 s", "3m 12s". Runs here are short, so hours are not split
// further than minutes.
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }
    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }
    return std::to_string(total_seconds / 60) + "m " +
           std::to_string(total_seconds % 60) + "s";
}

template <typename DurA, typename DurB>
inline std::string format_elapsed(const std::chrono::time_point<Clock, DurA>& start,
                                  const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// "[tag] message" on stderr when verbose.
inline void log_stage(bool verbose, const char* tag, const std::string& message) {
    if (!verbose) return;
    std::cerr << "[" << tag << "] " << message << "\n";
}

}  // namespace log_utils
}  // namespace sode
