#include "kinswing/background_model.hpp"
#include "kinswing/errors.hpp"

namespace kinswing {

BackgroundModel BackgroundModel::uniform(const Alphabet& alphabet) {
    std::vector<double> probs(alphabet.size(), 1.0 / static_cast<double>(alphabet.size()));
    return BackgroundModel(alphabet, std::move(probs), 0, true);
}

BackgroundModel BackgroundModel::from_substrates(const std::vector<SubstrateRecord>& substrates,
                                                 char wild_card,
                                                 const Alphabet& alphabet) {
    const size_t A = alphabet.size();
    std::vector<uint64_t> counts(A, 0);
    uint64_t total = 0;

    for (const auto& rec : substrates) {
        for (char c : rec.sequence) {
            if (c == wild_card) continue;
            const int idx = alphabet.index(c);
            if (idx < 0) throw InvalidAlphabetError(c, rec.kinase_id);
            ++counts[idx];
            ++total;
        }
    }

    if (total < A) {
        auto bg = uniform(alphabet);
        bg.observed_ = total;
        return bg;
    }

    // Add-one smoothing keeps every symbol strictly positive
    std::vector<double> probs(A);
    const double denom = static_cast<double>(total + A);
    for (size_t i = 0; i < A; ++i) {
        probs[i] = static_cast<double>(counts[i] + 1) / denom;
    }
    return BackgroundModel(alphabet, std::move(probs), total, false);
}

double BackgroundModel::frequency(char symbol) const {
    const int idx = alphabet_.index(symbol);
    return idx < 0 ? 0.0 : probs_[idx];
}

std::map<char, double> BackgroundModel::frequencies() const {
    std::map<char, double> out;
    for (size_t i = 0; i < probs_.size(); ++i) {
        out[alphabet_.symbol(i)] = probs_[i];
    }
    return out;
}

}  // namespace kinswing
