/**
 * @file cmd_interval.cpp
 * @brief Test a date interval against one or more entries.
 */

#include "subcommand.hpp"
#include "session_setup.hpp"
#include "sode/log_utils.hpp"
#include "sode/report.hpp"

namespace sode {
namespace cli {

int cmd_interval(int argc, char* argv[]) {
    return run_guarded("interval", [&]() {
        const Options opts = parse_args(Command::INTERVAL, argc, argv);
        auto session = build_session(opts);

        const IntervalAnalysis analysis = session->analyze(opts.entries, opts.interval);
        if (analysis.status == Status::DEGENERATE_QUERY) {
            log_utils::log_stage(opts.verbose, "interval",
                                 "single entry against the whole year");
        }

        with_output(opts, [&](std::ostream& os) {
            opts.json ? print_interval_json(analysis, opts.entries, os)
                      : print_interval(analysis, opts.entries, os);
        });
        if (!opts.calendar_out.empty()) {
            write_calendar_tsv(session->entries(), opts.calendar_out);
        }
        return analysis.ok() ? 0 : 1;
    });
}

}  // namespace cli
}  // namespace sode

namespace {
    struct IntervalRegistrar {
        IntervalRegistrar() {
            sode::cli::SubcommandRegistry::instance().register_command(
                "interval",
                "Probability that entries fall in a date interval",
                sode::cli::cmd_interval, 40);
        }
    };
    static IntervalRegistrar registrar;
}
