/**
 * @file cmd_prior.cpp
 * @brief Build a conception prior from daily observation counts.
 */

#include "subcommand.hpp"
#include "session_setup.hpp"
#include "sode/log_utils.hpp"
#include "sode/prior_builder.hpp"
#include "sode/report.hpp"
#include "sode/table_reader.hpp"

#include <stdexcept>
#include <vector>

namespace sode {
namespace cli {

namespace {

std::vector<double> load_counts(const std::string& path) {
    TableReader reader(path);
    std::vector<double> counts;
    std::vector<std::string> fields;
    while (reader.next_row(fields)) {
        counts.push_back(parse_double_field(fields.back(), reader));
    }
    return counts;
}

}  // namespace

int cmd_prior(int argc, char* argv[]) {
    return run_guarded("prior", [&]() {
        const Options opts = parse_args(Command::PRIOR, argc, argv);

        const auto counts = load_counts(opts.counts_file);
        PriorResult result = prior_from_counts(counts);
        if (!result.ok()) {
            throw std::runtime_error(opts.counts_file + ": " + status_to_string(result.status) +
                                     " (" + std::to_string(counts.size()) + " rows, expected " +
                                     std::to_string(kPriorLength) + ")");
        }
        if (opts.smooth) {
            PriorSmoothingParams params;
            params.window = opts.window;
            params.alpha = opts.alpha;
            result = smooth_prior(result.prior, params);
            if (!result.ok()) {
                throw std::runtime_error(std::string("Smoothing failed: ") +
                                         status_to_string(result.status));
            }
            log_utils::log_stage(opts.verbose, "prior",
                                 "Smoothed with a " + std::to_string(opts.window) + "-day window");
        }

        with_output(opts, [&](std::ostream& os) { write_prior(result.prior, os); });
        return 0;
    });
}

}  // namespace cli
}  // namespace sode

namespace {
    struct PriorRegistrar {
        PriorRegistrar() {
            sode::cli::SubcommandRegistry::instance().register_command(
                "prior",
                "Build a conception prior from daily counts",
                sode::cli::cmd_prior, 10);
        }
    };
    static PriorRegistrar registrar;
}
