#include "kinswing/pipeline.hpp"
#include "kinswing/log_utils.hpp"

#include <iostream>

namespace kinswing {

BuildOptions PipelineOptions::build_options() const {
    BuildOptions o;
    o.wild_card = wild_card;
    o.substrate_length = substrate_length;
    o.remove_center = remove_center;
    o.pseudo_count = pwm_pseudo;
    o.verbose = verbose;
    return o;
}

ScoreOptions PipelineOptions::score_options() const {
    ScoreOptions o;
    o.background = background;
    o.n = n;
    o.force_trim = force_trim;
    o.seed = seed;
    o.threads = threads;
    o.verbose = verbose;
    return o;
}

SwingOptions PipelineOptions::swing_options() const {
    SwingOptions o;
    o.pseudo_count = pseudo_count;
    o.p_cut_pwm = p_cut_pwm;
    o.p_cut_fc = p_cut_fc;
    o.permutations = permutations;
    o.seed = seed;
    o.threads = threads;
    o.verbose = verbose;
    return o;
}

PipelineResult run_pipeline(const std::vector<PeptideRecord>& input_data,
                            const std::vector<SubstrateRecord>& kinase_table,
                            const PipelineOptions& options) {
    // Reject bad configuration before any stage runs
    const BuildOptions build_opts = options.build_options();
    const ScoreOptions score_opts = options.score_options();
    const SwingOptions swing_opts = options.swing_options();
    build_opts.validate();
    score_opts.validate();
    swing_opts.validate();

    PipelineResult result;

    log_utils::stage_marker(options.verbose, 1, 3, "Building PWMs");
    result.pwms = build_pwm(kinase_table, build_opts);

    log_utils::stage_marker(options.verbose, 2, 3, "Scoring PWM matches to peptide sequences");
    result.scores = score_sequences(input_data, result.pwms, score_opts);

    log_utils::stage_marker(options.verbose, 3, 3, "Computing Swing scores");
    result.swing = swing(input_data, result.pwms, result.scores, swing_opts);

    if (options.verbose) std::cerr << "[COMPLETE]\n";
    return result;
}

}  // namespace kinswing
