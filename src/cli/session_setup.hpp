#ifndef SODE_CLI_SESSION_SETUP_HPP
#define SODE_CLI_SESSION_SETUP_HPP

#include "args.hpp"
#include "sode/session.hpp"

#include <functional>
#include <iosfwd>
#include <memory>

namespace sode {
namespace cli {

// Load the prior, calibration and specimen table named in `opts` and build a
// session whose entries follow the specimen rows. Throws std::runtime_error.
std::unique_ptr<Session> build_session(const Options& opts);

// Run `body` against opts.output_file, or stdout when none was given.
// Throws std::runtime_error if the file cannot be opened.
void with_output(const Options& opts, const std::function<void(std::ostream&)>& body);

// Shared try/catch around a subcommand body: ParseArgsExit -> its code,
// other exceptions -> "Error: ..." and 1.
int run_guarded(const char* tag, const std::function<int()>& body);

}  // namespace cli
}  // namespace sode

#endif  // SODE_CLI_SESSION_SETUP_HPP
