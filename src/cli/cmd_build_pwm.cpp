// kinswing build-pwm: PWMs from a kinase/substrate table
//
// Usage: kinswing build-pwm -k <kinase_table> [-o pwm.tsv] [options]
//
// Writes one row per (kinase, position, residue) with the position
// probability and its log-odds weight against the substrate background.

#include "subcommand.hpp"
#include "args.hpp"
#include "kinswing/log_utils.hpp"
#include "kinswing/pwm_builder.hpp"
#include "kinswing/table_io.hpp"
#include <chrono>
#include <iostream>

namespace kinswing {
namespace cli {

int cmd_build_pwm(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) std::cerr << e.message() << "\n";
        return e.exit_code();
    }

    auto run_start = std::chrono::steady_clock::now();
    try {
        auto kinase_table = read_kinase_table(opts.kinase_table, opts.table_format());
        if (opts.verbose) {
            std::cerr << "Kinase table: " << opts.kinase_table
                      << " (" << kinase_table.size() << " rows)\n";
        }

        const PwmSet pwms = build_pwm(kinase_table, opts.pipeline_options().build_options());
        write_pwm_table(pwms, opts.output_file);

        if (opts.verbose) {
            auto run_end = std::chrono::steady_clock::now();
            std::cerr << "Done. PWMs: " << pwms.size() << "\n";
            std::cerr << "  Runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace kinswing
