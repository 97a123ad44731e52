// sode command-line entry point.
//
//   sode prior --counts counts.tsv --smooth -o prior.tsv
//   sode ratio --lengths lengths.tsv
//   sode estimate --prior prior.tsv --specimens specimens.tsv --calibration calib/
//   sode interval ... --entries 1,2 --interval 152,243
//   sode combine ... --entries 1,2

#include "subcommand.hpp"
#include "sode/version.h"

#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    auto& registry = sode::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }
    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "sode " << SODE_VERSION << "\n";
        return 0;
    }

    return registry.run_command(argc - 1, argv + 1);
}
