#pragma once
// Position weight matrices from known kinase substrates.
//
// Each kinase gets a [substrate_length x alphabet] matrix of log-odds
// weights:  w(j, a) = log((count(j, a) / depth(j) + pseudo) / bg(a))
// where depth(j) counts substrates with a real residue (not the wild-card)
// at position j. Wild-card-only columns keep zero weight.

#include "kinswing/background_model.hpp"
#include "kinswing/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kinswing {

struct BuildOptions {
    char wild_card = DEFAULT_WILD_CARD;
    size_t substrate_length = DEFAULT_SUBSTRATE_LENGTH;
    std::optional<char> remove_center;       // drop substrates with this centre residue
    double pseudo_count = DEFAULT_PWM_PSEUDO;
    size_t min_confident_substrates = 3;     // below this a matrix is low confidence
    bool verbose = false;

    // Throws ConfigurationError
    void validate(const Alphabet& alphabet = Alphabet::amino_acids()) const;
};

struct PositionWeightMatrix {
    std::string kinase_id;
    size_t substrate_length = 0;
    size_t alphabet_size = 0;
    size_t n_substrates_used = 0;
    size_t min_confident_substrates = 0;
    double pseudo_count = 0.0;
    char wild_card = DEFAULT_WILD_CARD;
    std::vector<double> probabilities;  // row-major [position][symbol]
    std::vector<double> weights;        // log-odds, same layout
    std::vector<uint32_t> depth;        // non-wild-card residues per position

    double probability(size_t pos, size_t sym) const {
        return probabilities[pos * alphabet_size + sym];
    }
    double weight(size_t pos, size_t sym) const {
        return weights[pos * alphabet_size + sym];
    }
    const double* weight_row(size_t pos) const {
        return weights.data() + pos * alphabet_size;
    }
    bool low_confidence() const { return n_substrates_used < min_confident_substrates; }
};

// All matrices of one build plus the background they were computed against
struct PwmSet {
    std::vector<PositionWeightMatrix> matrices;  // sorted by kinase_id
    BackgroundModel background = BackgroundModel::uniform();
    size_t substrate_length = DEFAULT_SUBSTRATE_LENGTH;
    char wild_card = DEFAULT_WILD_CARD;

    // nullptr when the kinase is unknown
    const PositionWeightMatrix* find(const std::string& kinase_id) const;
    size_t size() const { return matrices.size(); }
    bool empty() const { return matrices.empty(); }
};

/**
 * Cut the substrate_length window centred on the record's phosphosite.
 * Longer sequences are trimmed; shorter ones throw SequenceLengthError.
 */
SubstrateRecord normalize_substrate(const SubstrateRecord& record, size_t substrate_length);

/**
 * Build one PWM per kinase.
 *
 * Throws InvalidAlphabetError, SequenceLengthError, EmptyKinaseGroupError
 * (kinase whose substrates were all empty or removed) or ConfigurationError.
 * Records with an empty sequence declare the kinase without a substrate.
 */
PwmSet build_pwm(const std::vector<SubstrateRecord>& kinase_table,
                 const BuildOptions& options = {},
                 const Alphabet& alphabet = Alphabet::amino_acids());

}  // namespace kinswing
