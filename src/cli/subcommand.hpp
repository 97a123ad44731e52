#ifndef SODE_CLI_SUBCOMMAND_HPP
#define SODE_CLI_SUBCOMMAND_HPP

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace sode {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands register themselves from static objects in their cmd_*.cpp file.
// The table is kept in workflow order (then registration order), which is
// the order `sode --help` lists them in.
class SubcommandRegistry {
public:
    struct Subcommand {
        std::string name;
        std::string description;
        int order;
        SubcommandFn fn;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    // nullptr when no command has that name.
    const Subcommand* find(const std::string& name) const;

    // argv[0] names the command. Unknown names print the command list to
    // stderr and return 1.
    int run_command(int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

    const std::vector<Subcommand>& commands() const { return commands_; }

private:
    SubcommandRegistry() = default;
    void print_command_list(std::ostream& os) const;

    std::vector<Subcommand> commands_;
};

int cmd_estimate(int argc, char* argv[]);
int cmd_interval(int argc, char* argv[]);
int cmd_combine(int argc, char* argv[]);
int cmd_prior(int argc, char* argv[]);
int cmd_ratio(int argc, char* argv[]);

}  // namespace cli
}  // namespace sode

#endif  // SODE_CLI_SUBCOMMAND_HPP
