#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kinswing {

// Defaults shared by the library options and the CLI
constexpr char DEFAULT_WILD_CARD = '_';
constexpr size_t DEFAULT_SUBSTRATE_LENGTH = 15;
constexpr double DEFAULT_PWM_PSEUDO = 0.01;
constexpr size_t DEFAULT_NULL_SAMPLES = 1000;
constexpr uint64_t DEFAULT_SEED = 1234;
constexpr double DEFAULT_SWING_PSEUDO = 1.0;
constexpr double DEFAULT_P_CUT_PWM = 0.05;
constexpr double DEFAULT_P_CUT_FC = 0.05;
constexpr int DEFAULT_PERMUTATIONS = 100;

/**
 * Residue alphabet with case-insensitive symbol lookup.
 *
 * index() returns -1 for anything outside the alphabet, including the
 * wild-card, so callers decide whether that is an error or a gap.
 */
class Alphabet {
public:
    explicit Alphabet(const std::string& symbols);

    // The 20 standard amino acids
    static const Alphabet& amino_acids();

    int index(char c) const {
        return index_[static_cast<unsigned char>(c)];
    }
    bool contains(char c) const { return index(c) >= 0; }
    char symbol(size_t i) const { return symbols_[i]; }
    size_t size() const { return symbols_.size(); }
    const std::string& symbols() const { return symbols_; }

private:
    std::string symbols_;
    std::array<int8_t, 256> index_;
};

// One known kinase-substrate pair. center_position indexes the phosphosite.
struct SubstrateRecord {
    std::string kinase_id;
    std::string sequence;
    size_t center_position = 0;

    // Record whose phosphosite sits at length / 2
    static SubstrateRecord centered(std::string kinase_id, std::string sequence) {
        SubstrateRecord rec;
        rec.center_position = sequence.size() / 2;
        rec.kinase_id = std::move(kinase_id);
        rec.sequence = std::move(sequence);
        return rec;
    }
};

// One measured phosphopeptide (input_data row)
struct PeptideRecord {
    std::string annotation;
    std::string sequence;
    double fold_change = 0.0;
    double p_value = 1.0;
};

// Score of one peptide against one kinase PWM
struct MatchScore {
    std::string kinase_id;
    std::string peptide_id;
    size_t peptide_index = 0;   // row in input_data
    double raw_score = 0.0;     // sum of log(p + pseudo), no background
    double log_odds_score = 0.0;
    double empirical_p = 1.0;   // (1 + #null >= score) / (n + 1)
};

// Per-kinase swing statistic. Empty optionals are NA.
struct SwingResult {
    std::string kinase_id;
    std::optional<double> swing_score;
    std::optional<double> empirical_p;
    std::optional<double> empirical_p_less;
    size_t n_substrates_significant = 0;  // network size
    size_t n_positive = 0;
    size_t n_negative = 0;
    std::optional<double> log_ratio;
    std::optional<double> swing_zscore;
    size_t n_permutations_run = 0;
};

}  // namespace kinswing
