// Main entry point for the kinswing CLI with subcommand dispatch
//
// Usage:
//   kinswing build-pwm -k kinases.tsv                PWMs only
//   kinswing score -k kinases.tsv -i peptides.tsv    PWM match scores
//   kinswing run -k kinases.tsv -i peptides.tsv      Swing scores (full pipeline)

#include "subcommand.hpp"
#include "kinswing/version.h"
#include <iostream>
#include <cstring>

int main(int argc, char* argv[]) {
    kinswing::cli::register_builtin_commands();
    auto& registry = kinswing::cli::SubcommandRegistry::instance();

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
        std::cout << "kinswing " << KINSWING_VERSION << "\n";
        return 0;
    }

    return registry.run_command(first_arg, argc - 1, argv + 1);
}
