#pragma once
// Tabular input and output.
//
// Inputs are delimited text, optionally gzip-compressed:
//   kinase_table: kinase_or_family_name, centered_peptide_sequence
//   input_data:   annotation, centered_peptide_sequence, fold_change, p_value
// Results are written as TSV with a header row; a ".gz" path is compressed
// and "-" writes to stdout.

#include "kinswing/pwm_builder.hpp"
#include "kinswing/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace kinswing {

struct TableFormat {
    char delimiter = '\0';   // '\0': comma for .csv / .csv.gz, tab otherwise
    bool has_header = true;
};

char detect_delimiter(const std::string& path);

// Split on `delim`, dropping a trailing '\r'. A field opening with a double
// quote runs to its closing quote, so it may hold `delim`; "" inside it is a
// literal quote.
std::vector<std::string> split_fields(const std::string& line, char delim);

// Line source over plain or gzip files (zlib, or rapidgzip when available)
class TableReader {
public:
    explicit TableReader(const std::string& path);
    ~TableReader();

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    bool readline(std::string& line);
    size_t line_number() const { return line_number_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    size_t line_number_ = 0;
};

// Throw MalformedInputError naming file, line and column
std::vector<SubstrateRecord> read_kinase_table(const std::string& path,
                                               const TableFormat& format = {});
std::vector<PeptideRecord> read_input_data(const std::string& path,
                                           const TableFormat& format = {});

// Text sink over stdout, plain or gzip files
class TableWriter {
public:
    explicit TableWriter(const std::string& path);
    ~TableWriter();

    TableWriter(const TableWriter&) = delete;
    TableWriter& operator=(const TableWriter&) = delete;

    void write(const std::string& text);
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

void write_pwm_table(const PwmSet& pwms, const std::string& path);
void write_match_scores(const std::vector<MatchScore>& scores, const std::string& path);
void write_swing_results(const std::vector<SwingResult>& results, const std::string& path);

}  // namespace kinswing
