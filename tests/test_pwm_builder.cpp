// tests/test_pwm_builder.cpp
//
// PWM construction:
//   - identical substrates put the maximal weight on the shared motif
//   - every weight is finite, wild-card-only columns stay at zero
//   - kinases without usable substrates, foreign symbols and short
//     sequences are rejected before any matrix is returned
//   - remove_center drops substrates by their centre residue

#include "kinswing/pwm_builder.hpp"
#include "kinswing/errors.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using kinswing::SubstrateRecord;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::vector<SubstrateRecord> repeated(const std::string& kinase, const std::string& seq, int n) {
    std::vector<SubstrateRecord> out;
    for (int i = 0; i < n; ++i) out.push_back(SubstrateRecord::centered(kinase, seq));
    return out;
}

int test_identical_substrates() {
    int failed = 0;
    auto pwms = kinswing::build_pwm(repeated("K1", "AAAMAAAAAAAAAAA", 5));
    expect(pwms.size() == 1, "one matrix", failed);
    const auto* pwm = pwms.find("K1");
    expect(pwm != nullptr, "K1 present", failed);
    if (!pwm) return failed;

    expect(pwm->substrate_length == 15, "window of 15", failed);
    expect(pwm->n_substrates_used == 5, "five substrates used", failed);

    const auto& aa = kinswing::Alphabet::amino_acids();
    const int m = aa.index('M');
    size_t best_pos = 0;
    int best_sym = 0;
    double best = -1e300;
    for (size_t j = 0; j < pwm->substrate_length; ++j) {
        for (size_t a = 0; a < pwm->alphabet_size; ++a) {
            const double w = pwm->weight(j, a);
            expect(std::isfinite(w), "finite weight", failed);
            if (w > best) {
                best = w;
                best_pos = j;
                best_sym = static_cast<int>(a);
            }
        }
    }
    expect(best_pos == 3 && best_sym == m, "maximal weight at position 3 for M", failed);
    expect(pwm->probability(3, m) == 1.0, "M fixed at position 3", failed);

    // Away from the motif A matches its background share
    const double w_a = pwm->weight(0, aa.index('A'));
    expect(w_a > 0.0 && w_a < best, "A elsewhere is close to background", failed);
    expect(pwm->weight(5, m) < 0.0, "M off-motif is penalized", failed);
    return failed;
}

int test_wild_card_column() {
    int failed = 0;
    auto table = repeated("K1", "_AAASAAAAAAAAAA", 4);
    auto pwms = kinswing::build_pwm(table);
    const auto* pwm = pwms.find("K1");
    if (!pwm) {
        expect(false, "K1 present", failed);
        return failed;
    }
    expect(pwm->depth[0] == 0, "column 0 has no residues", failed);
    expect(pwm->depth[1] == 4, "column 1 has four residues", failed);
    for (size_t a = 0; a < pwm->alphabet_size; ++a) {
        expect(pwm->weight(0, a) == 0.0, "wild-card column weight is zero", failed);
        expect(pwm->probability(0, a) == 0.0, "wild-card column probability is zero", failed);
    }
    expect(pwm->low_confidence() == false, "four substrates are enough", failed);
    return failed;
}

int test_multiple_kinases_sorted() {
    int failed = 0;
    auto table = repeated("ZAK", "AAAAAAASAAAAAAA", 2);
    auto more = repeated("ABL1", "GGGGGGGYGGGGGGG", 1);
    table.insert(table.end(), more.begin(), more.end());

    auto pwms = kinswing::build_pwm(table);
    expect(pwms.size() == 2, "two kinases", failed);
    expect(pwms.matrices[0].kinase_id == "ABL1", "sorted by kinase id", failed);
    expect(pwms.matrices[1].kinase_id == "ZAK", "sorted by kinase id", failed);
    expect(pwms.matrices[0].low_confidence(), "single substrate is low confidence", failed);
    expect(pwms.find("MISSING") == nullptr, "unknown kinase", failed);
    return failed;
}

int test_longer_substrates_trimmed() {
    int failed = 0;
    SubstrateRecord rec;
    rec.kinase_id = "K1";
    rec.sequence = "WWWWAAAAAAASAAAAAAAWWWW";
    rec.center_position = 11;

    auto norm = kinswing::normalize_substrate(rec, 15);
    expect(norm.sequence == "AAAAAAASAAAAAAA", "window centred on the phosphosite", failed);
    expect(norm.center_position == 7, "centre moves to L/2", failed);

    bool threw = false;
    rec.center_position = 3;
    try {
        (void)kinswing::normalize_substrate(rec, 15);
    } catch (const kinswing::SequenceLengthError&) {
        threw = true;
    }
    expect(threw, "site too close to the N-terminus", failed);
    return failed;
}

int test_empty_group() {
    int failed = 0;
    auto table = repeated("K1", "AAAMAAAAAAAAAAA", 3);
    table.push_back(SubstrateRecord::centered("K2", ""));

    bool threw = false;
    try {
        (void)kinswing::build_pwm(table);
    } catch (const kinswing::EmptyKinaseGroupError& e) {
        threw = true;
        expect(e.key() == "K2", "error names K2", failed);
    }
    expect(threw, "K2 has no substrate", failed);
    return failed;
}

int test_invalid_alphabet() {
    int failed = 0;
    auto table = repeated("K1", "AAAMAAAAAAAAAAA", 2);
    table.push_back(SubstrateRecord::centered("K3", "AAAAAAAB"));  // also too short

    bool threw = false;
    try {
        (void)kinswing::build_pwm(table);
    } catch (const kinswing::InvalidAlphabetError& e) {
        threw = true;
        expect(e.symbol() == 'B', "offending symbol", failed);
        expect(e.key() == "K3", "offending record", failed);
    }
    expect(threw, "alphabet checked before length", failed);
    return failed;
}

int test_short_substrate() {
    int failed = 0;
    auto table = repeated("K1", "AAAMAAA", 1);
    bool threw = false;
    try {
        (void)kinswing::build_pwm(table);
    } catch (const kinswing::SequenceLengthError&) {
        threw = true;
    }
    expect(threw, "7 residues cannot fill a 15 window", failed);

    kinswing::BuildOptions opts;
    opts.substrate_length = 7;
    auto pwms = kinswing::build_pwm(table, opts);
    expect(pwms.substrate_length == 7, "shorter window accepted", failed);
    return failed;
}

int test_remove_center() {
    int failed = 0;
    auto table = repeated("K1", "AAAAAAASAAAAAAA", 3);
    auto tyr = repeated("K1", "AAAAAAAYAAAAAAA", 2);
    table.insert(table.end(), tyr.begin(), tyr.end());

    kinswing::BuildOptions opts;
    opts.remove_center = 's';
    auto pwms = kinswing::build_pwm(table, opts);
    const auto* pwm = pwms.find("K1");
    expect(pwm && pwm->n_substrates_used == 2, "serine-centred substrates removed", failed);

    bool threw = false;
    auto only_ser = repeated("K2", "AAAAAAASAAAAAAA", 2);
    try {
        (void)kinswing::build_pwm(only_ser, opts);
    } catch (const kinswing::EmptyKinaseGroupError& e) {
        threw = true;
        expect(e.key() == "K2", "emptied kinase named", failed);
    }
    expect(threw, "removing every substrate empties the group", failed);
    return failed;
}

int test_bad_options() {
    int failed = 0;
    auto table = repeated("K1", "AAAMAAAAAAAAAAA", 2);

    kinswing::BuildOptions opts;
    opts.wild_card = 'A';
    bool threw = false;
    try {
        (void)kinswing::build_pwm(table, opts);
    } catch (const kinswing::ConfigurationError& e) {
        threw = true;
        expect(e.key() == "wild_card", "option named", failed);
    }
    expect(threw, "wild-card inside the alphabet", failed);

    opts = kinswing::BuildOptions{};
    opts.substrate_length = 0;
    threw = false;
    try {
        (void)kinswing::build_pwm(table, opts);
    } catch (const kinswing::ConfigurationError&) {
        threw = true;
    }
    expect(threw, "zero substrate length", failed);
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_identical_substrates();
    total += test_wild_card_column();
    total += test_multiple_kinases_sorted();
    total += test_longer_substrates_trimmed();
    total += test_empty_group();
    total += test_invalid_alphabet();
    total += test_short_substrate();
    total += test_remove_center();
    total += test_bad_options();

    if (total == 0) {
        std::cout << "All PWM builder tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
