#pragma once
// swing_master: PWM building, sequence scoring and swing in fixed order.

#include "kinswing/pwm_builder.hpp"
#include "kinswing/sequence_scorer.hpp"
#include "kinswing/swing_engine.hpp"
#include "kinswing/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace kinswing {

// Canonical parameter set of a full run
struct PipelineOptions {
    char wild_card = DEFAULT_WILD_CARD;
    size_t substrate_length = DEFAULT_SUBSTRATE_LENGTH;
    std::optional<char> remove_center;
    double pwm_pseudo = DEFAULT_PWM_PSEUDO;
    BackgroundKind background = BackgroundKind::RANDOM;
    size_t n = DEFAULT_NULL_SAMPLES;
    bool force_trim = false;
    std::optional<uint64_t> seed = DEFAULT_SEED;
    double pseudo_count = DEFAULT_SWING_PSEUDO;
    double p_cut_pwm = DEFAULT_P_CUT_PWM;
    double p_cut_fc = DEFAULT_P_CUT_FC;
    int permutations = DEFAULT_PERMUTATIONS;
    bool verbose = false;
    int threads = 1;

    BuildOptions build_options() const;
    ScoreOptions score_options() const;
    SwingOptions swing_options() const;
};

// Every intermediate table stays inspectable
struct PipelineResult {
    PwmSet pwms;
    std::vector<MatchScore> scores;
    std::vector<SwingResult> swing;
};

PipelineResult run_pipeline(const std::vector<PeptideRecord>& input_data,
                            const std::vector<SubstrateRecord>& kinase_table,
                            const PipelineOptions& options = {});

}  // namespace kinswing
