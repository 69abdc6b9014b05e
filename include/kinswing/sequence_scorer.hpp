#pragma once
// Peptide scoring against kinase PWMs with an empirical null.
//
// Each kinase is one task: score every peptide, draw n random peptides from
// the PWM set's background, score them once and rank the observed scores
// against the sorted null:
//   p = (1 + #{null >= observed}) / (n + 1)
// so 1/(n+1) <= p <= 1.

#include "kinswing/pwm_builder.hpp"
#include "kinswing/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kinswing {

enum class BackgroundKind {
    RANDOM  // peptides drawn from the background composition
};

// Parse "random"; throws ConfigurationError for anything else
BackgroundKind parse_background_kind(const std::string& name);
const char* background_kind_name(BackgroundKind kind);

struct ScoreOptions {
    BackgroundKind background = BackgroundKind::RANDOM;
    size_t n = DEFAULT_NULL_SAMPLES;
    bool force_trim = false;                      // not supported, ignored with a notice
    std::optional<uint64_t> seed = DEFAULT_SEED;  // nullopt: fresh seed per kinase
    int threads = 1;
    bool verbose = false;

    // Throws ConfigurationError
    void validate() const;
};

// Peptide residues as alphabet indices aligned to PWM positions (-1 = gap)
struct EncodedPeptide {
    size_t peptide_index = 0;
    std::vector<int8_t> residues;
};

/**
 * Align `sequence` to a window of `substrate_length` by its centre.
 * Returns nullopt for a shorter peptide that cannot be centred
 * symmetrically. Throws InvalidAlphabetError naming `record`.
 */
std::optional<std::vector<int8_t>> encode_peptide(const std::string& sequence,
                                                  size_t substrate_length,
                                                  char wild_card,
                                                  const Alphabet& alphabet,
                                                  const std::string& record);

// Sum of PWM log-odds over aligned, non-gap positions
double log_odds_score(const PositionWeightMatrix& pwm, const std::vector<int8_t>& residues);

// Sum of log(probability + pseudo) over aligned, non-gap positions
double raw_score(const PositionWeightMatrix& pwm, const std::vector<int8_t>& residues);

// (1 + #{x in sorted_null : x >= observed}) / (n + 1)
double empirical_p_value(const std::vector<double>& sorted_null, double observed);

/**
 * Score every peptide against every PWM.
 *
 * Output is sorted by (kinase_id, peptide_id, peptide_index) and does not
 * depend on options.threads. Peptides that cannot be aligned produce no
 * records.
 */
std::vector<MatchScore> score_sequences(const std::vector<PeptideRecord>& input_data,
                                        const PwmSet& pwm_in,
                                        const ScoreOptions& options = {});

}  // namespace kinswing
