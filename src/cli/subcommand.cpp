#include "subcommand.hpp"
#include "sode/version.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace sode {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    auto pos = std::upper_bound(commands_.begin(), commands_.end(), order,
                                [](int o, const Subcommand& c) { return o < c.order; });
    commands_.insert(pos, Subcommand{name, description, order, std::move(fn)});
}

const SubcommandRegistry::Subcommand* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return &cmd;
    }
    return nullptr;
}

int SubcommandRegistry::run_command(int argc, char* argv[]) const {
    const std::string name = argc > 0 ? argv[0] : "";
    const Subcommand* cmd = find(name);
    if (cmd == nullptr) {
        std::cerr << "Unknown command: " << name << "\n\nCommands:\n";
        print_command_list(std::cerr);
        return 1;
    }
    return cmd->fn(argc, argv);
}

void SubcommandRegistry::print_command_list(std::ostream& os) const {
    size_t width = 0;
    for (const auto& cmd : commands_) width = std::max(width, cmd.name.size());
    for (const auto& cmd : commands_) {
        os << "  " << cmd.name << std::string(width + 2 - cmd.name.size(), ' ')
           << cmd.description << "\n";
    }
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "SODE v" << SODE_VERSION << " - season of death estimation\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    print_command_list(std::cout);
    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace sode
