// kinswing run: full swing pipeline
//
// Usage: kinswing run -k <kinase_table> -i <input_data> [-o swing.tsv]
//
// PWMs -> PWM match scores -> swing scores with network permutations.
// --pwm-out and --scores-out keep the intermediate tables.

#include "subcommand.hpp"
#include "args.hpp"
#include "kinswing/log_utils.hpp"
#include "kinswing/pipeline.hpp"
#include "kinswing/table_io.hpp"
#include <chrono>
#include <iostream>

namespace kinswing {
namespace cli {

int cmd_run(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) std::cerr << e.message() << "\n";
        return e.exit_code();
    }

    auto run_start = std::chrono::steady_clock::now();
    try {
        const PipelineOptions popts = opts.pipeline_options();
        auto kinase_table = read_kinase_table(opts.kinase_table, opts.table_format());
        auto input_data = read_input_data(opts.input_data, opts.table_format());
        if (opts.verbose) {
            std::cerr << "Kinase table: " << opts.kinase_table
                      << " (" << kinase_table.size() << " rows)\n";
            std::cerr << "Input data: " << opts.input_data
                      << " (" << input_data.size() << " peptides)\n";
            std::cerr << "Threads: " << opts.num_threads << "\n";
            std::cerr << "Seed: " << (popts.seed ? std::to_string(*popts.seed) : "none") << "\n\n";
        }

        const PipelineResult result = run_pipeline(input_data, kinase_table, popts);

        if (!opts.pwm_out.empty()) write_pwm_table(result.pwms, opts.pwm_out);
        if (!opts.scores_out.empty()) write_match_scores(result.scores, opts.scores_out);
        write_swing_results(result.swing, opts.output_file);

        if (opts.verbose) {
            auto run_end = std::chrono::steady_clock::now();
            std::cerr << "Done. Kinases: " << result.swing.size() << "\n";
            std::cerr << "  Total runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace kinswing
