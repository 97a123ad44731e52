/**
 * @file cmd_estimate.cpp
 * @brief Season-of-death calendar for every specimen in a table.
 */

#include "subcommand.hpp"
#include "session_setup.hpp"
#include "sode/report.hpp"

namespace sode {
namespace cli {

int cmd_estimate(int argc, char* argv[]) {
    return run_guarded("estimate", [&]() {
        const Options opts = parse_args(Command::ESTIMATE, argc, argv);
        auto session = build_session(opts);

        with_output(opts, [&](std::ostream& os) {
            opts.json ? print_entries_json(session->entries(), os)
                      : print_entries(session->entries(), os);
        });
        if (!opts.calendar_out.empty()) {
            write_calendar_tsv(session->entries(), opts.calendar_out);
        }
        return 0;
    });
}

}  // namespace cli
}  // namespace sode

namespace {
    struct EstimateRegistrar {
        EstimateRegistrar() {
            sode::cli::SubcommandRegistry::instance().register_command(
                "estimate",
                "Death-date calendar per specimen",
                sode::cli::cmd_estimate, 30);
        }
    };
    static EstimateRegistrar registrar;
}
