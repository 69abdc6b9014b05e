// Peptide-to-PWM scoring with a random-background null distribution
//
// OpenMP distributes kinases over workers. Each worker owns its generator,
// seeded from the global seed and the kinase id, and writes only its own
// fragment; fragments are concatenated after the join.

#include "kinswing/sequence_scorer.hpp"
#include "kinswing/errors.hpp"
#include "kinswing/log_utils.hpp"
#include "kinswing/random_streams.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <iterator>
#include <random>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace kinswing {

BackgroundKind parse_background_kind(const std::string& name) {
    if (name == "random") return BackgroundKind::RANDOM;
    throw ConfigurationError("background", "'" + name + "' (only \"random\" is supported)");
}

const char* background_kind_name(BackgroundKind kind) {
    switch (kind) {
        case BackgroundKind::RANDOM: return "random";
    }
    return "unknown";
}

void ScoreOptions::validate() const {
    if (n < 1) {
        throw ConfigurationError("n", "null sample count must be >= 1");
    }
    if (threads < 1) {
        throw ConfigurationError("threads", "must be >= 1");
    }
}

std::optional<std::vector<int8_t>> encode_peptide(const std::string& sequence,
                                                  size_t substrate_length,
                                                  char wild_card,
                                                  const Alphabet& alphabet,
                                                  const std::string& record) {
    const size_t len = sequence.size();
    for (char c : sequence) {
        if (c != wild_card && !alphabet.contains(c)) {
            throw InvalidAlphabetError(c, record);
        }
    }

    if (len == 0) return std::nullopt;
    if (len < substrate_length && (substrate_length - len) % 2 != 0) {
        return std::nullopt;  // centre would be off by one
    }

    // PWM position j sits on peptide index j - L/2 + len/2
    std::vector<int8_t> residues(substrate_length, -1);
    const long offset = static_cast<long>(len / 2) - static_cast<long>(substrate_length / 2);
    for (size_t j = 0; j < substrate_length; ++j) {
        const long k = static_cast<long>(j) + offset;
        if (k < 0 || k >= static_cast<long>(len)) continue;
        residues[j] = static_cast<int8_t>(alphabet.index(sequence[k]));  // -1 for wild-card
    }
    return residues;
}

double log_odds_score(const PositionWeightMatrix& pwm, const std::vector<int8_t>& residues) {
    double s = 0.0;
    const size_t L = std::min(pwm.substrate_length, residues.size());
    for (size_t j = 0; j < L; ++j) {
        if (residues[j] < 0) continue;
        s += pwm.weight(j, residues[j]);
    }
    return s;
}

double raw_score(const PositionWeightMatrix& pwm, const std::vector<int8_t>& residues) {
    double s = 0.0;
    const size_t L = std::min(pwm.substrate_length, residues.size());
    for (size_t j = 0; j < L; ++j) {
        if (residues[j] < 0 || pwm.depth[j] == 0) continue;
        s += std::log(pwm.probability(j, residues[j]) + pwm.pseudo_count);
    }
    return s;
}

double empirical_p_value(const std::vector<double>& sorted_null, double observed) {
    const auto first_ge = std::lower_bound(sorted_null.begin(), sorted_null.end(), observed);
    const size_t n_ge = static_cast<size_t>(sorted_null.end() - first_ge);
    return static_cast<double>(1 + n_ge) / static_cast<double>(sorted_null.size() + 1);
}

// One kinase: null sampling followed by peptide scoring
static std::vector<MatchScore> score_kinase(const PositionWeightMatrix& pwm,
                                            const BackgroundModel& background,
                                            const std::vector<PeptideRecord>& peptides,
                                            const std::vector<EncodedPeptide>& encoded,
                                            size_t n,
                                            uint64_t seed) {
    std::mt19937_64 rng(seed);
    auto dist = background.sampler();

    std::vector<double> null_scores(n);
    std::vector<int8_t> random_peptide(pwm.substrate_length);
    for (size_t i = 0; i < n; ++i) {
        for (auto& r : random_peptide) r = static_cast<int8_t>(dist(rng));
        null_scores[i] = log_odds_score(pwm, random_peptide);
    }
    std::sort(null_scores.begin(), null_scores.end());

    std::vector<MatchScore> out;
    out.reserve(encoded.size());
    for (const auto& ep : encoded) {
        MatchScore ms;
        ms.kinase_id = pwm.kinase_id;
        ms.peptide_id = peptides[ep.peptide_index].annotation;
        ms.peptide_index = ep.peptide_index;
        ms.raw_score = raw_score(pwm, ep.residues);
        ms.log_odds_score = log_odds_score(pwm, ep.residues);
        ms.empirical_p = empirical_p_value(null_scores, ms.log_odds_score);
        out.push_back(std::move(ms));
    }

    std::sort(out.begin(), out.end(), [](const MatchScore& a, const MatchScore& b) {
        if (a.peptide_id != b.peptide_id) return a.peptide_id < b.peptide_id;
        return a.peptide_index < b.peptide_index;
    });
    return out;
}

std::vector<MatchScore> score_sequences(const std::vector<PeptideRecord>& input_data,
                                        const PwmSet& pwm_in,
                                        const ScoreOptions& options) {
    options.validate();
    auto t_start = std::chrono::steady_clock::now();

    if (options.force_trim) {
        std::cerr << "Warning: force_trim is not supported in this version and is ignored\n";
    }

    const Alphabet& alphabet = pwm_in.background.alphabet();
    const size_t L = pwm_in.substrate_length;

    // Validate and encode everything before any worker starts
    std::vector<EncodedPeptide> encoded;
    encoded.reserve(input_data.size());
    size_t skipped = 0;
    for (size_t i = 0; i < input_data.size(); ++i) {
        const auto& pep = input_data[i];
        auto residues = encode_peptide(pep.sequence, L, pwm_in.wild_card, alphabet, pep.annotation);
        if (!residues) {
            std::cerr << "Warning: peptide " << pep.annotation << " (" << pep.sequence
                      << ") cannot be centred on a " << L << "-residue window, not scored\n";
            ++skipped;
            continue;
        }
        encoded.push_back({i, std::move(*residues)});
    }

    const size_t K = pwm_in.matrices.size();
    std::vector<uint64_t> seeds(K);
    for (size_t k = 0; k < K; ++k) {
        seeds[k] = derive_stream_seed(options.seed, pwm_in.matrices[k].kinase_id, STREAM_SCORER);
    }

    if (options.verbose) {
        std::cerr << "Scoring " << encoded.size() << " peptides against " << K << " PWMs\n";
        std::cerr << "  Background: " << background_kind_name(options.background)
                  << ", null samples: " << options.n << "\n";
        if (skipped > 0) std::cerr << "  Skipped peptides: " << skipped << "\n";
    }

    std::vector<std::vector<MatchScore>> fragments(K);

    #pragma omp parallel for schedule(dynamic, 1) num_threads(options.threads)
    for (size_t k = 0; k < K; ++k) {
        fragments[k] = score_kinase(pwm_in.matrices[k], pwm_in.background,
                                    input_data, encoded, options.n, seeds[k]);
    }

    // Matrices are sorted by kinase, fragments by peptide: concatenation is ordered
    std::vector<MatchScore> scores;
    scores.reserve(K * encoded.size());
    for (auto& frag : fragments) {
        std::move(frag.begin(), frag.end(), std::back_inserter(scores));
    }

    if (options.verbose) {
        auto t_end = std::chrono::steady_clock::now();
        std::cerr << "  Match scores: " << scores.size() << "\n";
        std::cerr << "  Runtime: " << log_utils::format_elapsed(t_start, t_end) << "\n";
    }
    return scores;
}

}  // namespace kinswing
