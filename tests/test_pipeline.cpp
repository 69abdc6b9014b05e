// tests/test_pipeline.cpp
//
// End-to-end runs of build_pwm -> score_sequences -> swing.

#include "kinswing/pipeline.hpp"
#include "kinswing/errors.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using kinswing::PeptideRecord;
using kinswing::SubstrateRecord;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::vector<SubstrateRecord> k1_table() {
    std::vector<SubstrateRecord> table;
    for (int i = 0; i < 5; ++i) table.push_back(SubstrateRecord::centered("K1", "AAAMAAAAAAAAAAA"));
    return table;
}

int test_single_motif_match() {
    int failed = 0;
    std::vector<PeptideRecord> input = {{"K1_site", "AAAMAAAAAAAAAAA", 2.0, 0.01}};

    kinswing::PipelineOptions opts;
    opts.permutations = 0;
    auto res = kinswing::run_pipeline(input, k1_table(), opts);

    expect(res.pwms.size() == 1, "one PWM", failed);
    expect(res.scores.size() == 1, "one match score", failed);
    expect(!res.scores.empty() && res.scores[0].empirical_p <= 0.05, "motif is a network edge", failed);
    expect(res.swing.size() == 1, "one swing row", failed);
    if (res.swing.empty()) return failed;
    expect(res.swing[0].swing_score && *res.swing[0].swing_score == 1.0, "swing = +1", failed);
    expect(!res.swing[0].empirical_p, "p is NA without permutations", failed);
    return failed;
}

int test_reproducible_run() {
    int failed = 0;
    auto table = k1_table();
    for (int i = 0; i < 3; ++i) table.push_back(SubstrateRecord::centered("K2", "RRRAASPGGGKKEEL"));

    std::vector<PeptideRecord> input;
    const char* seqs[] = {"AAAMAAAAAAAAAAA", "RRRAASPGGGKKEEL", "AAAMAAAAAAASAAA",
                          "RRKAASPGGGKKEEL", "GGGGGGGSGGGGGGG", "PPPPPPPTPPPPPPP"};
    for (int i = 0; i < 6; ++i) {
        input.push_back({"p" + std::to_string(i), seqs[i], (i % 2 ? -1.0 : 1.0) * (i + 1), 0.01});
    }

    kinswing::PipelineOptions opts;
    opts.permutations = 10;
    opts.seed = 1234;
    opts.n = 200;

    auto a = kinswing::run_pipeline(input, table, opts);
    opts.threads = 2;
    auto b = kinswing::run_pipeline(input, table, opts);

    expect(a.scores.size() == b.scores.size(), "same score table", failed);
    for (size_t i = 0; i < a.scores.size() && i < b.scores.size(); ++i) {
        expect(a.scores[i].empirical_p == b.scores[i].empirical_p, "scores reproducible", failed);
    }
    expect(a.swing.size() == 2 && b.swing.size() == 2, "two kinases", failed);
    for (size_t i = 0; i < a.swing.size() && i < b.swing.size(); ++i) {
        expect(a.swing[i].empirical_p == b.swing[i].empirical_p, "swing p reproducible", failed);
        expect(a.swing[i].swing_score == b.swing[i].swing_score, "swing reproducible", failed);
    }
    return failed;
}

int test_empty_kinase_group() {
    int failed = 0;
    auto table = k1_table();
    table.push_back(SubstrateRecord::centered("K2", ""));
    std::vector<PeptideRecord> input = {{"p", "AAAMAAAAAAAAAAA", 2.0, 0.01}};

    bool threw = false;
    try {
        (void)kinswing::run_pipeline(input, table);
    } catch (const kinswing::EmptyKinaseGroupError& e) {
        threw = true;
        expect(e.key() == "K2", "K2 named", failed);
    }
    expect(threw, "run stops on an empty kinase group", failed);
    return failed;
}

int test_configuration_checked_first() {
    int failed = 0;
    // The table would fail later with InvalidAlphabetError
    std::vector<SubstrateRecord> table = {SubstrateRecord::centered("K1", "XXXXXXXXXXXXXXX")};
    std::vector<PeptideRecord> input = {{"p", "AAAMAAAAAAAAAAA", 2.0, 0.01}};

    kinswing::PipelineOptions opts;
    opts.p_cut_pwm = 1.5;
    bool threw = false;
    try {
        (void)kinswing::run_pipeline(input, table, opts);
    } catch (const kinswing::ConfigurationError& e) {
        threw = true;
        expect(e.key() == "p_cut_pwm", "option named", failed);
    }
    expect(threw, "bad option rejected before any stage", failed);

    opts = kinswing::PipelineOptions{};
    threw = false;
    try {
        (void)kinswing::run_pipeline(input, table, opts);
    } catch (const kinswing::InvalidAlphabetError&) {
        threw = true;
    }
    expect(threw, "foreign residues rejected", failed);
    return failed;
}

// Redirects std::cerr into a buffer for the lifetime of the object
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

int test_verbose_stage_markers() {
    int failed = 0;
    std::vector<PeptideRecord> input = {{"K1_site", "AAAMAAAAAAAAAAA", 2.0, 0.01}};
    kinswing::PipelineOptions opts;
    opts.verbose = true;
    opts.n = 50;
    opts.permutations = 0;

    std::string log;
    {
        CerrCapture capture;
        (void)kinswing::run_pipeline(input, k1_table(), opts);
        log = capture.str();
    }

    const char* markers[] = {
        "[Step1/3] : Building PWMs\n",
        "[Step2/3] : Scoring PWM matches to peptide sequences\n",
        "[Step3/3] : Computing Swing scores\n",
        "[COMPLETE]\n",
    };
    size_t from = 0;
    for (const char* m : markers) {
        const size_t pos = log.find(m, from);
        expect(pos != std::string::npos, std::string("marker in order: ") + m, failed);
        if (pos != std::string::npos) from = pos + 1;
    }

    opts.verbose = false;
    {
        CerrCapture capture;
        (void)kinswing::run_pipeline(input, k1_table(), opts);
        log = capture.str();
    }
    expect(log.find("[Step1/3]") == std::string::npos, "quiet run prints no markers", failed);
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_single_motif_match();
    total += test_reproducible_run();
    total += test_empty_kinase_group();
    total += test_configuration_checked_first();
    total += test_verbose_stage_markers();

    if (total == 0) {
        std::cout << "All pipeline tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
