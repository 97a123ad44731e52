/**
 * @file cmd_ratio.cpp
 * @brief Bootstrap the ancient/modern body-size length ratio of each element.
 */

#include "subcommand.hpp"
#include "session_setup.hpp"
#include "sode/bootstrap.hpp"
#include "sode/log_utils.hpp"
#include "sode/report.hpp"

#include <cstdlib>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace sode {
namespace cli {

namespace {

// --threads wins over SODE_THREADS; 0 leaves the OpenMP default.
int resolve_threads(int requested) {
    if (requested > 0) return requested;
    if (const char* env = std::getenv("SODE_THREADS")) {
        const int n = std::atoi(env);
        if (n > 0) return n;
    }
    return 0;
}

}  // namespace

int cmd_ratio(int argc, char* argv[]) {
    return run_guarded("ratio", [&]() {
        const Options opts = parse_args(Command::RATIO, argc, argv);

        const int threads = resolve_threads(opts.num_threads);
#ifdef _OPENMP
        if (threads > 0) omp_set_num_threads(threads);
#else
        if (threads > 1) {
            log_utils::log_stage(opts.verbose, "ratio", "built without OpenMP, using 1 thread");
        }
#endif

        const auto rows = load_length_rows(opts.lengths_file);
        BootstrapParams params;
        params.resamples = opts.resamples;
        params.seed = opts.seed;

        const auto t0 = log_utils::Clock::now();
        const ElementRatios ratios = bootstrap_element_ratios(rows, params);
        log_utils::log_stage(opts.verbose, "ratio",
                             std::to_string(rows.size()) + " lengths, " +
                                 std::to_string(opts.resamples) + " resamples per group in " +
                                 log_utils::format_elapsed(t0, log_utils::Clock::now()));

        size_t usable = 0;
        for (size_t i = 0; i < kNumElements; ++i) {
            const Element el = static_cast<Element>(i);
            if (ratios[i].ok()) {
                ++usable;
                log_utils::log_stage(opts.verbose, "ratio",
                                     std::string(element_to_string(el)) + ": side " +
                                         most_common_side(rows, el));
            }
        }
        if (usable == 0) {
            throw std::runtime_error(opts.lengths_file +
                                     ": no element has lengths in every form/sex group");
        }

        with_output(opts, [&](std::ostream& os) {
            opts.json ? print_ratios_json(ratios, os) : print_ratios(ratios, os);
        });
        return 0;
    });
}

}  // namespace cli
}  // namespace sode

namespace {
    struct RatioRegistrar {
        RatioRegistrar() {
            sode::cli::SubcommandRegistry::instance().register_command(
                "ratio",
                "Bootstrap ancient/modern length ratio",
                sode::cli::cmd_ratio, 20);
        }
    };
    static RatioRegistrar registrar;
}
