/**
 * @file cmd_combine.cpp
 * @brief Fuse entries believed to come from one individual.
 *
 * Groups run in order, so "1,2;3,4;5,6" can combine the two combined
 * entries created by the first groups (numbered after the specimens).
 */

#include "subcommand.hpp"
#include "session_setup.hpp"
#include "sode/log_utils.hpp"
#include "sode/report.hpp"

#include <vector>

namespace sode {
namespace cli {

int cmd_combine(int argc, char* argv[]) {
    return run_guarded("combine", [&]() {
        const Options opts = parse_args(Command::COMBINE, argc, argv);
        auto session = build_session(opts);

        std::vector<CombineResult> results;
        bool failed = false;
        for (const auto& group : opts.combinations) {
            results.push_back(session->combine(group));
            const CombineResult& r = results.back();
            if (r.status == Status::INVALID_SELECTION || r.status == Status::INVALID_RANGE ||
                r.status == Status::NORMALIZATION_FAILURE) {
                failed = true;
            }
            log_utils::log_stage(opts.verbose, "combine",
                                 combined_label(r.sources) + ": " + status_to_string(r.status));
        }

        with_output(opts, [&](std::ostream& os) {
            if (opts.json) {
                print_combinations_json(results, *session, os);
                return;
            }
            for (const auto& r : results) print_combination(r, os);
            for (const auto& r : results) {
                if (!r.ok()) continue;
                os << "\n";
                print_entry(session->entry(r.index), os);
            }
        });
        if (!opts.calendar_out.empty()) {
            write_calendar_tsv(session->entries(), opts.calendar_out);
        }
        return failed ? 1 : 0;
    });
}

}  // namespace cli
}  // namespace sode

namespace {
    struct CombineRegistrar {
        CombineRegistrar() {
            sode::cli::SubcommandRegistry::instance().register_command(
                "combine",
                "Combine entries from one individual",
                sode::cli::cmd_combine, 50);
        }
    };
    static CombineRegistrar registrar;
}
