#pragma once
// Background amino-acid frequencies.
//
// Built from the aggregate composition of the substrate sequences handed to
// the PWM builder. Feeds the log-odds transform and the random peptides of
// the scorer's null distribution.

#include "kinswing/types.hpp"

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace kinswing {

class BackgroundModel {
public:
    // Uniform over the alphabet
    static BackgroundModel uniform(const Alphabet& alphabet = Alphabet::amino_acids());

    /**
     * Laplace-smoothed composition of all residues in `substrates`.
     * Wild-card positions are not counted. Falls back to uniform when fewer
     * residues than alphabet symbols were observed.
     * Throws InvalidAlphabetError on any other symbol.
     */
    static BackgroundModel from_substrates(const std::vector<SubstrateRecord>& substrates,
                                           char wild_card,
                                           const Alphabet& alphabet = Alphabet::amino_acids());

    // Probability of `symbol`; 0 for symbols outside the alphabet
    double frequency(char symbol) const;

    // symbol -> probability
    std::map<char, double> frequencies() const;

    const std::vector<double>& probabilities() const { return probs_; }
    const Alphabet& alphabet() const { return alphabet_; }
    size_t observed_residues() const { return observed_; }
    bool is_uniform() const { return uniform_; }

    // Distribution over symbol indices; workers keep their own copy
    std::discrete_distribution<int> sampler() const {
        return std::discrete_distribution<int>(probs_.begin(), probs_.end());
    }

    // Draw `length` i.i.d. symbol indices into `out`
    template <typename Rng>
    void sample_indices(Rng& rng, size_t length, std::vector<int8_t>& out) const {
        auto dist = sampler();
        out.resize(length);
        for (size_t i = 0; i < length; ++i) {
            out[i] = static_cast<int8_t>(dist(rng));
        }
    }

    template <typename Rng>
    std::string sample(Rng& rng, size_t length) const {
        std::vector<int8_t> idx;
        sample_indices(rng, length, idx);
        std::string seq(length, ' ');
        for (size_t i = 0; i < length; ++i) seq[i] = alphabet_.symbol(idx[i]);
        return seq;
    }

private:
    BackgroundModel(const Alphabet& alphabet, std::vector<double> probs,
                    size_t observed, bool uniform)
        : alphabet_(alphabet), probs_(std::move(probs)),
          observed_(observed), uniform_(uniform) {}

    Alphabet alphabet_;  // owned copy
    std::vector<double> probs_;
    size_t observed_ = 0;
    bool uniform_ = true;
};

}  // namespace kinswing
