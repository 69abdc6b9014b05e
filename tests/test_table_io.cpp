// tests/test_table_io.cpp
//
// Delimited table input (plain, gzip, CSV) and TSV result output.

#include "kinswing/table_io.hpp"
#include "kinswing/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() /
                ("kinswing_table_io_" + std::to_string(::getpid()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

void write_gz(const std::string& path, const std::string& text) {
    gzFile gz = gzopen(path.c_str(), "wb");
    gzwrite(gz, text.data(), static_cast<unsigned>(text.size()));
    gzclose(gz);
}

std::string read_gz(const std::string& path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    std::string out;
    char buf[4096];
    int n;
    while ((n = gzread(gz, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    gzclose(gz);
    return out;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

int test_split_fields() {
    int failed = 0;
    auto f = kinswing::split_fields("\"K1\",AAASAAA,1.5\r", ',');
    expect(f.size() == 3, "three fields", failed);
    expect(f.size() == 3 && f[0] == "K1", "quotes stripped", failed);
    expect(f.size() == 3 && f[2] == "1.5", "carriage return stripped", failed);
    expect(kinswing::split_fields("a\t\tb", '\t').size() == 3, "empty middle field kept", failed);

    auto q = kinswing::split_fields("\"CDK1, CDK2\",\"say \"\"hi\"\"\",,x", ',');
    expect(q.size() == 4, "delimiter inside quotes does not split", failed);
    expect(q.size() == 4 && q[0] == "CDK1, CDK2", "quoted field keeps its comma", failed);
    expect(q.size() == 4 && q[1] == "say \"hi\"", "doubled quote is literal", failed);
    expect(q.size() == 4 && q[2].empty() && q[3] == "x", "fields after quotes", failed);
    expect(kinswing::detect_delimiter("x.csv") == ',', "csv", failed);
    expect(kinswing::detect_delimiter("x.csv.gz") == ',', "gzipped csv", failed);
    expect(kinswing::detect_delimiter("x.tsv") == '\t', "tsv", failed);
    return failed;
}

int test_read_kinase_table(const TempDir& dir) {
    int failed = 0;
    const std::string path = dir.file("kinases.tsv");
    write_text(path, "kinase\tsequence\nK1\tAAAMAAAAAAAAAAA\nK1\tAAAMAAAAAAAAAAA\r\nK2\tNA\n\n");

    auto rows = kinswing::read_kinase_table(path);
    expect(rows.size() == 3, "header and blank line skipped", failed);
    if (rows.size() == 3) {
        expect(rows[0].kinase_id == "K1" && rows[0].center_position == 7, "centred record", failed);
        expect(rows[1].sequence == "AAAMAAAAAAAAAAA", "CRLF handled", failed);
        expect(rows[2].kinase_id == "K2" && rows[2].sequence.empty(), "NA sequence is empty", failed);
    }

    const std::string csv = dir.file("kinases.csv.gz");
    write_gz(csv, "K3,PPPPPPPTPPPPPPP\n");
    kinswing::TableFormat no_header;
    no_header.has_header = false;
    auto gz_rows = kinswing::read_kinase_table(csv, no_header);
    expect(gz_rows.size() == 1 && gz_rows[0].kinase_id == "K3", "gzip csv without header", failed);
    return failed;
}

int test_read_input_data(const TempDir& dir) {
    int failed = 0;
    const std::string path = dir.file("input.tsv.gz");
    write_gz(path, "annotation\tpeptide\tfc\tp\n"
                   "P1|S15\tAAAMAAAAAAAAAAA\t2.5\t0.01\n"
                   "P2|T3\t__AAAAATAAAAAAA\t-1e-1\t1\n");
    auto rows = kinswing::read_input_data(path);
    expect(rows.size() == 2, "two peptides", failed);
    if (rows.size() == 2) {
        expect(rows[0].annotation == "P1|S15" && rows[0].fold_change == 2.5, "first row", failed);
        expect(rows[1].fold_change == -0.1 && rows[1].p_value == 1.0, "second row", failed);
    }

    const std::string csv = dir.file("input.csv");
    write_text(csv, "annotation,peptide,fc,p\n"
                    "\"Q9Y2K2, isoform 2|S7\",AAAMAAAAAAAAAAA,1.25,0.5\r\n");
    auto csv_rows = kinswing::read_input_data(csv);
    expect(csv_rows.size() == 1, "quoted comma is not a column", failed);
    if (csv_rows.size() == 1) {
        expect(csv_rows[0].annotation == "Q9Y2K2, isoform 2|S7", "annotation with comma", failed);
        expect(csv_rows[0].p_value == 0.5, "columns after the quoted field", failed);
    }
    return failed;
}

int test_malformed_tables(const TempDir& dir) {
    int failed = 0;
    auto expect_malformed = [&](const std::string& name, const std::string& text, bool kinase) {
        const std::string path = dir.file(name);
        write_text(path, text);
        bool threw = false;
        try {
            if (kinase) (void)kinswing::read_kinase_table(path);
            else (void)kinswing::read_input_data(path);
        } catch (const kinswing::MalformedInputError&) {
            threw = true;
        }
        expect(threw, "malformed " + name, failed);
    };

    expect_malformed("three_cols.tsv", "h\th\nK1\tAAA\textra\n", true);
    expect_malformed("no_kinase.tsv", "h\th\n\tAAA\n", true);
    expect_malformed("short_row.tsv", "a\tb\tc\td\nP1\tAAA\t1.0\n", false);
    expect_malformed("bad_fc.tsv", "a\tb\tc\td\nP1\tAAA\tup\t0.1\n", false);
    expect_malformed("bad_p.tsv", "a\tb\tc\td\nP1\tAAA\t1.0\t1.2\n", false);

    bool threw = false;
    try {
        (void)kinswing::read_kinase_table(dir.file("missing.tsv"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "missing file", failed);
    return failed;
}

int test_write_swing_results(const TempDir& dir) {
    int failed = 0;
    kinswing::SwingResult defined;
    defined.kinase_id = "K1";
    defined.swing_score = 0.5;
    defined.empirical_p = 0.25;
    defined.empirical_p_less = 0.75;
    defined.n_substrates_significant = 4;
    defined.n_positive = 3;
    defined.n_negative = 1;
    defined.log_ratio = 1.0;
    defined.n_permutations_run = 100;

    kinswing::SwingResult empty;
    empty.kinase_id = "K2";

    const std::string path = dir.file("swing.tsv.gz");
    kinswing::write_swing_results({defined, empty}, path);
    auto lines = lines_of(read_gz(path));
    expect(lines.size() == 3, "header plus two rows", failed);
    if (lines.size() == 3) {
        expect(lines[0].rfind("kinase\tn_positive", 0) == 0, "header", failed);
        expect(lines[1] == "K1\t3\t1\t4\t1\t0.5\tNA\t0.25\t0.75\t100", "defined row", failed);
        expect(lines[2] == "K2\t0\t0\t0\tNA\tNA\tNA\tNA\tNA\t0", "NA row", failed);
    }
    return failed;
}

int test_write_pwm_and_scores(const TempDir& dir) {
    int failed = 0;
    std::vector<kinswing::SubstrateRecord> table;
    for (int i = 0; i < 3; ++i) {
        table.push_back(kinswing::SubstrateRecord::centered("K1", "AAAMAAAAAAAAAAA"));
    }
    auto pwms = kinswing::build_pwm(table);

    const std::string pwm_path = dir.file("pwm.tsv");
    kinswing::write_pwm_table(pwms, pwm_path);
    std::ifstream in(pwm_path);
    std::stringstream ss;
    ss << in.rdbuf();
    auto lines = lines_of(ss.str());
    expect(lines.size() == 1 + 15 * 20, "one row per position and residue", failed);
    if (lines.size() > 1) {
        expect(lines[1].rfind("K1\t3\t-7\tA\t3\t1\t", 0) == 0, "first row at position -7", failed);
    }

    kinswing::MatchScore ms;
    ms.kinase_id = "K1";
    ms.peptide_id = "p";
    ms.peptide_index = 2;
    ms.raw_score = -1.5;
    ms.log_odds_score = 3.25;
    ms.empirical_p = 0.001;
    const std::string score_path = dir.file("scores.tsv");
    kinswing::write_match_scores({ms}, score_path);
    std::ifstream sin(score_path);
    std::stringstream sss;
    sss << sin.rdbuf();
    auto score_lines = lines_of(sss.str());
    expect(score_lines.size() == 2 && score_lines[1] == "K1\tp\t2\t-1.5\t3.25\t0.001",
           "match score row", failed);
    return failed;
}

}  // namespace

int main() {
    TempDir dir;
    int total = 0;
    total += test_split_fields();
    total += test_read_kinase_table(dir);
    total += test_read_input_data(dir);
    total += test_malformed_tables(dir);
    total += test_write_swing_results(dir);
    total += test_write_pwm_and_scores(dir);

    if (total == 0) {
        std::cout << "All table I/O tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
