#pragma once
// Swing statistic: directional kinase activity from significant PWM matches.
//
// For kinase k with network edges E_k = {matches with empirical_p <= p_cut_pwm}:
//   swing(k) = (#{e : fc > 0, p <= p_cut_fc} - #{e : fc < 0, p <= p_cut_fc}) / |E_k|
// The null permutes (fold_change, p_value) pairs over the whole peptide
// population while edges stay fixed.

#include "kinswing/pwm_builder.hpp"
#include "kinswing/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace kinswing {

struct SwingOptions {
    double pseudo_count = DEFAULT_SWING_PSEUDO;   // log-ratio smoothing
    double p_cut_pwm = DEFAULT_P_CUT_PWM;
    double p_cut_fc = DEFAULT_P_CUT_FC;
    int permutations = DEFAULT_PERMUTATIONS;      // <= 1 disables the null
    std::optional<uint64_t> seed = DEFAULT_SEED;
    int threads = 1;
    bool verbose = false;

    // Throws ConfigurationError
    void validate() const;
};

// Label of one peptide under the fold-change significance gate: -1, 0 or +1
inline int directional_label(double fold_change, double p_value, double p_cut_fc) {
    if (!(p_value <= p_cut_fc)) return 0;
    if (fold_change > 0.0) return 1;
    if (fold_change < 0.0) return -1;
    return 0;
}

/**
 * Swing score of one network given the labels of its edges.
 * nullopt for an empty network.
 */
std::optional<double> swing_statistic(const std::vector<int>& edge_labels);

/**
 * Compute one SwingResult per kinase in `pwm_in`, sorted by kinase_id.
 *
 * Kinases without significant matches are reported with NA score and p.
 * Throws MalformedInputError when a match refers to an unknown kinase or
 * peptide, or a peptide carries an invalid p_value / fold_change.
 */
std::vector<SwingResult> swing(const std::vector<PeptideRecord>& input_data,
                               const PwmSet& pwm_in,
                               const std::vector<MatchScore>& pwm_scores,
                               const SwingOptions& options = {});

}  // namespace kinswing
