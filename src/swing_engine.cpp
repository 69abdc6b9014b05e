// Swing scores with network-permutation significance
//
// Edges (kinase -> peptide matches passing p_cut_pwm) are fixed. The null
// reassigns (fold_change, p_value) labels across the full peptide
// population. Each permutation only needs the labels landing on the
// kinase's m edges, so a partial Fisher-Yates draw of m positions replaces
// a full shuffle.

#include "kinswing/swing_engine.hpp"
#include "kinswing/errors.hpp"
#include "kinswing/log_utils.hpp"
#include "kinswing/random_streams.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace kinswing {

void SwingOptions::validate() const {
    if (!(p_cut_pwm >= 0.0 && p_cut_pwm <= 1.0)) {
        throw ConfigurationError("p_cut_pwm", "must be within [0, 1]");
    }
    if (!(p_cut_fc >= 0.0 && p_cut_fc <= 1.0)) {
        throw ConfigurationError("p_cut_fc", "must be within [0, 1]");
    }
    if (!(pseudo_count >= 0.0) || !std::isfinite(pseudo_count)) {
        throw ConfigurationError("pseudo_count", "must be finite and >= 0");
    }
    if (threads < 1) {
        throw ConfigurationError("threads", "must be >= 1");
    }
}

std::optional<double> swing_statistic(const std::vector<int>& edge_labels) {
    if (edge_labels.empty()) return std::nullopt;
    long net = 0;
    for (int l : edge_labels) net += l;
    return static_cast<double>(net) / static_cast<double>(edge_labels.size());
}

namespace {

struct KinaseNetwork {
    std::vector<size_t> edges;  // peptide indices
};

// Upper and lower smoothed ranks; both NA for a null without spread
void permutation_p_values(const std::vector<double>& null_scores, double observed,
                          SwingResult& result) {
    const auto [lo, hi] = std::minmax_element(null_scores.begin(), null_scores.end());
    if (*lo == *hi) return;

    size_t n_ge = 0, n_le = 0;
    for (double s : null_scores) {
        if (s >= observed) ++n_ge;
        if (s <= observed) ++n_le;
    }
    const double denom = static_cast<double>(null_scores.size() + 1);
    result.empirical_p = static_cast<double>(1 + n_ge) / denom;
    result.empirical_p_less = static_cast<double>(1 + n_le) / denom;
}

SwingResult swing_kinase(const std::string& kinase_id,
                         const KinaseNetwork& network,
                         const std::vector<int>& labels,
                         const SwingOptions& options,
                         uint64_t seed) {
    SwingResult result;
    result.kinase_id = kinase_id;
    const size_t m = network.edges.size();
    result.n_substrates_significant = m;
    if (m == 0) return result;

    std::vector<int> edge_labels(m);
    for (size_t e = 0; e < m; ++e) {
        const int l = labels[network.edges[e]];
        edge_labels[e] = l;
        if (l > 0) ++result.n_positive;
        if (l < 0) ++result.n_negative;
    }
    result.swing_score = swing_statistic(edge_labels);

    const double pos = static_cast<double>(result.n_positive) + options.pseudo_count;
    const double neg = static_cast<double>(result.n_negative) + options.pseudo_count;
    if (pos > 0.0 && neg > 0.0) {
        result.log_ratio = std::log2(pos / neg);
    }

    if (options.permutations <= 1) return result;

    std::mt19937_64 rng(seed);
    const size_t P = labels.size();
    std::vector<size_t> order(P);
    std::iota(order.begin(), order.end(), size_t{0});

    std::vector<double> null_scores;
    null_scores.reserve(static_cast<size_t>(options.permutations));
    for (int t = 0; t < options.permutations; ++t) {
        for (size_t e = 0; e < m; ++e) {
            std::uniform_int_distribution<size_t> pick(e, P - 1);
            std::swap(order[e], order[pick(rng)]);
            edge_labels[e] = labels[order[e]];
        }
        null_scores.push_back(*swing_statistic(edge_labels));
    }
    result.n_permutations_run = null_scores.size();
    permutation_p_values(null_scores, *result.swing_score, result);
    return result;
}

// Standardize log ratios across kinases (sample standard deviation)
void assign_zscores(std::vector<SwingResult>& results) {
    std::vector<double> values;
    for (const auto& r : results) {
        if (r.log_ratio) values.push_back(*r.log_ratio);
    }
    if (values.size() < 2) return;

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    const double sd = std::sqrt(ss / static_cast<double>(values.size() - 1));
    if (!(sd > 0.0)) return;

    for (auto& r : results) {
        if (r.log_ratio) r.swing_zscore = (*r.log_ratio - mean) / sd;
    }
}

}  // namespace

std::vector<SwingResult> swing(const std::vector<PeptideRecord>& input_data,
                               const PwmSet& pwm_in,
                               const std::vector<MatchScore>& pwm_scores,
                               const SwingOptions& options) {
    options.validate();
    auto t_start = std::chrono::steady_clock::now();

    std::vector<int> labels(input_data.size());
    for (size_t i = 0; i < input_data.size(); ++i) {
        const auto& pep = input_data[i];
        if (!(pep.p_value >= 0.0 && pep.p_value <= 1.0)) {
            throw MalformedInputError("p_value of peptide " + pep.annotation +
                                      " is outside [0, 1]", pep.annotation);
        }
        if (!std::isfinite(pep.fold_change)) {
            throw MalformedInputError("fold_change of peptide " + pep.annotation +
                                      " is not finite", pep.annotation);
        }
        labels[i] = directional_label(pep.fold_change, pep.p_value, options.p_cut_fc);
    }

    const size_t K = pwm_in.matrices.size();
    std::vector<KinaseNetwork> networks(K);
    for (const auto& ms : pwm_scores) {
        const auto* pwm = pwm_in.find(ms.kinase_id);
        if (!pwm) {
            throw MalformedInputError("Match score for unknown kinase " + ms.kinase_id,
                                      ms.kinase_id);
        }
        if (ms.peptide_index >= input_data.size() ||
            input_data[ms.peptide_index].annotation != ms.peptide_id) {
            throw MalformedInputError("Match score for kinase " + ms.kinase_id +
                                      " refers to unknown peptide " + ms.peptide_id,
                                      ms.peptide_id);
        }
        if (!(ms.empirical_p >= 0.0 && ms.empirical_p <= 1.0)) {
            throw MalformedInputError("empirical_p of match " + ms.kinase_id + "/" +
                                      ms.peptide_id + " is outside [0, 1]", ms.peptide_id);
        }
        if (ms.empirical_p <= options.p_cut_pwm) {
            networks[static_cast<size_t>(pwm - pwm_in.matrices.data())].edges.push_back(ms.peptide_index);
        }
    }

    // A peptide is one edge per kinase however many times it was scored
    for (auto& net : networks) {
        std::sort(net.edges.begin(), net.edges.end());
        net.edges.erase(std::unique(net.edges.begin(), net.edges.end()), net.edges.end());
    }

    std::vector<uint64_t> seeds(K);
    for (size_t k = 0; k < K; ++k) {
        seeds[k] = derive_stream_seed(options.seed, pwm_in.matrices[k].kinase_id, STREAM_SWING);
    }

    if (options.verbose) {
        size_t n_edges = 0;
        for (const auto& net : networks) n_edges += net.edges.size();
        std::cerr << "Computing swing scores for " << K << " kinases\n";
        std::cerr << "  Network edges (p <= " << options.p_cut_pwm << "): " << n_edges << "\n";
        if (options.permutations > 1) {
            std::cerr << "  Permutations: " << options.permutations << "\n";
        } else {
            std::cerr << "  Permutations: off\n";
        }
    }

    std::vector<SwingResult> results(K);

    #pragma omp parallel for schedule(dynamic, 1) num_threads(options.threads)
    for (size_t k = 0; k < K; ++k) {
        results[k] = swing_kinase(pwm_in.matrices[k].kinase_id, networks[k],
                                  labels, options, seeds[k]);
    }

    assign_zscores(results);

    if (options.verbose) {
        size_t defined = 0;
        for (const auto& r : results) {
            if (r.swing_score) ++defined;
        }
        auto t_end = std::chrono::steady_clock::now();
        std::cerr << "  Kinases with a network: " << defined << "/" << K << "\n";
        std::cerr << "  Runtime: " << log_utils::format_elapsed(t_start, t_end) << "\n";
    }
    return results;
}

}  // namespace kinswing
