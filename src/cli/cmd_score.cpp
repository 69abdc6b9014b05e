// kinswing score: PWM match scores with random-background p-values
//
// Usage: kinswing score -k <kinase_table> -i <input_data> [-o scores.tsv]
//
// Builds the PWMs, then scores every peptide against every kinase. The
// p-value of a match is its smoothed rank among n random peptides drawn
// from the substrate background.

#include "subcommand.hpp"
#include "args.hpp"
#include "kinswing/log_utils.hpp"
#include "kinswing/pwm_builder.hpp"
#include "kinswing/sequence_scorer.hpp"
#include "kinswing/table_io.hpp"
#include <chrono>
#include <iostream>

namespace kinswing {
namespace cli {

int cmd_score(int argc, char* argv[]) {
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
        }

        log_utils::stage_marker(opts.verbose, 1, 2, "Building PWMs");
        const PwmSet pwms = build_pwm(kinase_table, popts.build_options());

        log_utils::stage_marker(opts.verbose, 2, 2, "Scoring PWM matches to peptide sequences");
        const auto scores = score_sequences(input_data, pwms, popts.score_options());
        write_match_scores(scores, opts.output_file);

        if (opts.verbose) {
            auto run_end = std::chrono::steady_clock::now();
            std::cerr << "Done. Match scores: " << scores.size() << "\n";
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
