// PWM construction from kinase-substrate tables

#include "kinswing/pwm_builder.hpp"
#include "kinswing/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>

namespace kinswing {

void BuildOptions::validate(const Alphabet& alphabet) const {
    if (substrate_length == 0) {
        throw ConfigurationError("substrate_length", "must be >= 1");
    }
    if (alphabet.contains(wild_card)) {
        throw ConfigurationError("wild_card",
                                 std::string("'") + wild_card + "' is an alphabet symbol");
    }
    if (!(pseudo_count >= 0.0) || !std::isfinite(pseudo_count)) {
        throw ConfigurationError("pseudo_count", "must be finite and >= 0");
    }
    if (remove_center && !alphabet.contains(*remove_center)) {
        throw ConfigurationError("remove_center",
                                 std::string("'") + *remove_center + "' is not an alphabet symbol");
    }
}

const PositionWeightMatrix* PwmSet::find(const std::string& kinase_id) const {
    auto it = std::lower_bound(matrices.begin(), matrices.end(), kinase_id,
        [](const PositionWeightMatrix& m, const std::string& id) {
            return m.kinase_id < id;
        });
    if (it == matrices.end() || it->kinase_id != kinase_id) return nullptr;
    return &*it;
}

SubstrateRecord normalize_substrate(const SubstrateRecord& record, size_t substrate_length) {
    const size_t half = substrate_length / 2;
    const size_t len = record.sequence.size();
    if (record.center_position < half ||
        record.center_position - half + substrate_length > len) {
        throw SequenceLengthError(record.kinase_id + ":" + record.sequence, len, substrate_length);
    }

    SubstrateRecord out;
    out.kinase_id = record.kinase_id;
    out.sequence = record.sequence.substr(record.center_position - half, substrate_length);
    out.center_position = half;
    return out;
}

// Count residues per position and convert to probabilities and log-odds
static PositionWeightMatrix build_matrix(const std::string& kinase_id,
                                         const std::vector<const SubstrateRecord*>& group,
                                         const BackgroundModel& background,
                                         const BuildOptions& options,
                                         const Alphabet& alphabet) {
    const size_t L = options.substrate_length;
    const size_t A = alphabet.size();

    PositionWeightMatrix pwm;
    pwm.kinase_id = kinase_id;
    pwm.substrate_length = L;
    pwm.alphabet_size = A;
    pwm.n_substrates_used = group.size();
    pwm.min_confident_substrates = options.min_confident_substrates;
    pwm.pseudo_count = options.pseudo_count;
    pwm.wild_card = options.wild_card;
    pwm.probabilities.assign(L * A, 0.0);
    pwm.weights.assign(L * A, 0.0);
    pwm.depth.assign(L, 0);

    std::vector<uint32_t> counts(L * A, 0);
    for (const auto* rec : group) {
        for (size_t j = 0; j < L; ++j) {
            const int idx = alphabet.index(rec->sequence[j]);
            if (idx < 0) continue;  // wild-card, already validated
            ++counts[j * A + idx];
            ++pwm.depth[j];
        }
    }

    const auto& bg = background.probabilities();
    for (size_t j = 0; j < L; ++j) {
        if (pwm.depth[j] == 0) continue;  // neutral column
        const double depth = static_cast<double>(pwm.depth[j]);
        for (size_t a = 0; a < A; ++a) {
            const double p = counts[j * A + a] / depth;
            pwm.probabilities[j * A + a] = p;
            pwm.weights[j * A + a] = std::log((p + options.pseudo_count) / bg[a]);
        }
    }
    return pwm;
}

PwmSet build_pwm(const std::vector<SubstrateRecord>& kinase_table,
                 const BuildOptions& options,
                 const Alphabet& alphabet) {
    options.validate(alphabet);

    // Validate alphabet before any length or grouping decision
    for (const auto& rec : kinase_table) {
        for (char c : rec.sequence) {
            if (c != options.wild_card && !alphabet.contains(c)) {
                throw InvalidAlphabetError(c, rec.kinase_id);
            }
        }
    }

    if (options.verbose) {
        std::cerr << "Building PWMs from " << kinase_table.size() << " substrate rows\n";
    }

    // Normalize and filter; every kinase named in the table gets a group
    std::map<std::string, std::vector<size_t>> groups;
    std::vector<SubstrateRecord> normalized;
    normalized.reserve(kinase_table.size());
    size_t removed_center = 0;

    const int removed_idx = options.remove_center ? alphabet.index(*options.remove_center) : -1;

    for (const auto& rec : kinase_table) {
        auto& group = groups[rec.kinase_id];
        if (rec.sequence.empty()) continue;

        SubstrateRecord norm = normalize_substrate(rec, options.substrate_length);
        if (removed_idx >= 0 && alphabet.index(norm.sequence[norm.center_position]) == removed_idx) {
            ++removed_center;
            continue;
        }
        group.push_back(normalized.size());
        normalized.push_back(std::move(norm));
    }

    if (options.verbose && options.remove_center) {
        std::cerr << "  Removed " << removed_center << " substrates with centre residue '"
                  << *options.remove_center << "'\n";
    }

    for (const auto& [kinase_id, members] : groups) {
        if (members.empty()) throw EmptyKinaseGroupError(kinase_id);
    }

    PwmSet set;
    set.substrate_length = options.substrate_length;
    set.wild_card = options.wild_card;
    set.background = BackgroundModel::from_substrates(normalized, options.wild_card, alphabet);
    set.matrices.reserve(groups.size());

    if (options.verbose && set.background.is_uniform()) {
        std::cerr << "  Too few residues for a composition background ("
                  << set.background.observed_residues() << "), using uniform\n";
    }

    std::vector<const SubstrateRecord*> members_ptr;
    size_t low_confidence = 0;
    for (const auto& [kinase_id, members] : groups) {
        members_ptr.clear();
        for (size_t idx : members) members_ptr.push_back(&normalized[idx]);
        set.matrices.push_back(build_matrix(kinase_id, members_ptr, set.background, options, alphabet));
        if (set.matrices.back().low_confidence()) ++low_confidence;
    }

    if (options.verbose) {
        std::cerr << "  PWMs: " << set.matrices.size()
                  << " (" << normalized.size() << " substrates)\n";
        if (low_confidence > 0) {
            std::cerr << "  Warning: " << low_confidence << " PWMs built from fewer than "
                      << options.min_confident_substrates << " substrates\n";
        }
    }

    return set;
}

}  // namespace kinswing
