// Unit tests for the subcommand registry

#include "cli/subcommand.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace {

using sode::cli::SubcommandRegistry;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

int last_argc = 0;
std::string last_name;

int record(int argc, char* argv[]) {
    last_argc = argc;
    last_name = argv[0];
    return 7;
}

int test_order() {
    std::cout << "[T1] workflow order\n";
    int failed = 0;

    auto& registry = SubcommandRegistry::instance();
    registry.register_command("late", "Registered first, listed last", record, 30);
    registry.register_command("early", "Listed first", record, 10);
    registry.register_command("middle", "Between", record, 20);
    registry.register_command("middle2", "Same order, later registration", record, 20);

    const auto& cmds = registry.commands();
    expect(cmds.size() == 4, "four commands", failed);
    if (cmds.size() == 4) {
        expect(cmds[0].name == "early" && cmds[1].name == "middle" &&
                   cmds[2].name == "middle2" && cmds[3].name == "late",
               "sorted by order, ties by registration", failed);
    }
    expect(registry.find("middle") != nullptr, "find known", failed);
    expect(registry.find("mid") == nullptr, "no prefix match", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_run() {
    std::cout << "[T2] run_command\n";
    int failed = 0;

    auto& registry = SubcommandRegistry::instance();
    std::vector<char*> args = {strdup("early"), strdup("--flag")};
    const int rc = registry.run_command(static_cast<int>(args.size()), args.data());
    expect(rc == 7, "handler result returned", failed);
    expect(last_name == "early" && last_argc == 2, "handler sees its own argv", failed);
    for (char* a : args) std::free(a);

    std::vector<char*> unknown = {strdup("nosuch")};
    last_argc = 0;
    expect(registry.run_command(1, unknown.data()) == 1, "unknown command exits 1", failed);
    expect(last_argc == 0, "no handler ran", failed);
    for (char* a : unknown) std::free(a);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_order();
    total += test_run();

    if (total == 0) {
        std::cout << "\nAll subcommand tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
