#include "session_setup.hpp"
#include "sode/bootstrap.hpp"
#include "sode/gestation.hpp"
#include "sode/log_utils.hpp"
#include "sode/prior_builder.hpp"
#include "sode/specimens.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace sode {
namespace cli {

std::unique_ptr<Session> build_session(const Options& opts) {
    using log_utils::log_stage;
    const char* tag = command_name(opts.command);
    const auto t0 = log_utils::Clock::now();

    PriorResult prior = load_prior(opts.prior_file);
    if (!prior.ok()) {
        throw std::runtime_error("Prior " + opts.prior_file + ": " +
                                 status_to_string(prior.status));
    }
    log_stage(opts.verbose, tag, "Prior: " + opts.prior_file);

    std::optional<GestationResolver> resolver;
    if (!opts.calibration_dir.empty()) {
        ResolverParams params;
        params.measurement_error = opts.measurement_error;
        resolver = GestationResolver::load(opts.calibration_dir, params);
        log_stage(opts.verbose, tag, "Calibration: " + opts.calibration_dir);
        if (!opts.size_ratios_file.empty()) {
            resolver->apply_size_ratios(load_size_ratios(opts.size_ratios_file));
            log_stage(opts.verbose, tag, "Size ratios: " + opts.size_ratios_file);
        }
    }

    const auto rows = load_specimens(opts.specimens_file);
    auto session = std::make_unique<Session>(prior.prior);
    add_specimens(*session, rows, resolver ? &*resolver : nullptr);

    log_stage(opts.verbose, tag,
              std::to_string(session->size()) + " entries from " + opts.specimens_file +
                  " (" + log_utils::format_elapsed(t0, log_utils::Clock::now()) + ")");
    return session;
}

void with_output(const Options& opts, const std::function<void(std::ostream&)>& body) {
    if (opts.output_file.empty()) {
        body(std::cout);
        return;
    }
    std::ofstream ofs(opts.output_file);
    if (!ofs) {
        throw std::runtime_error("Failed to open output file: " + opts.output_file);
    }
    body(ofs);
}

int run_guarded(const char* tag, const std::function<int()>& body) {
    try {
        return body();
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.code();
    } catch (const std::exception& e) {
        std::cerr << "[" << tag << "] Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cli
}  // namespace sode
