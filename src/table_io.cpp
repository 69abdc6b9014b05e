#include "kinswing/table_io.hpp"
#include "kinswing/errors.hpp"
#include "kinswing/gz_reader_base.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <zlib.h>

namespace kinswing {

constexpr size_t LINE_BUF_SIZE = 65536;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

char detect_delimiter(const std::string& path) {
    if (ends_with(path, ".csv") || ends_with(path, ".csv.gz")) return ',';
    return '\t';
}

std::vector<std::string> split_fields(const std::string& line, char delim) {
    size_t end = line.size();
    if (end > 0 && line[end - 1] == '\r') --end;

    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < end; ++i) {
        const char c = line[i];
        if (quoted) {
            if (c != '"') {
                field.push_back(c);
            } else if (i + 1 < end && line[i + 1] == '"') {
                field.push_back('"');  // "" inside quotes
                ++i;
            } else {
                quoted = false;
            }
        } else if (c == '"' && field.empty()) {
            quoted = true;
        } else if (c == delim) {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

// ---------------------------------------------------------------------------
// TableReader
// ---------------------------------------------------------------------------

class TableReader::Impl {
public:
    explicit Impl(const std::string& path) {
        fast_ = make_gz_reader(path);
        if (fast_) return;

        // gzopen reads uncompressed files transparently
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) throw std::runtime_error("Failed to open file: " + path);
        gzbuffer(gz_, GzLineReader::GZBUF_SIZE);
    }

    ~Impl() {
        if (gz_) gzclose(gz_);
    }

    bool readline(std::string& line) {
        if (fast_) return fast_->readline(line);

        line.clear();
        while (gzgets(gz_, buffer_, sizeof(buffer_))) {
            size_t len = std::strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                return true;
            }
            line.append(buffer_, len);  // line longer than the buffer
        }
        return !line.empty();
    }

private:
    std::unique_ptr<GzLineReader> fast_;
    gzFile gz_ = nullptr;
    char buffer_[LINE_BUF_SIZE];
};

TableReader::TableReader(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {}

TableReader::~TableReader() = default;

bool TableReader::readline(std::string& line) {
    if (!impl_->readline(line)) return false;
    ++line_number_;
    return true;
}

// ---------------------------------------------------------------------------
// Readers
// ---------------------------------------------------------------------------

static std::string where(const std::string& path, size_t line) {
    return path + ":" + std::to_string(line);
}

static double parse_real(const std::string& value, const std::string& column,
                         const std::string& path, size_t line) {
    try {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        while (idx < value.size() && std::isspace(static_cast<unsigned char>(value[idx]))) ++idx;
        if (idx == value.size()) return parsed;
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    throw MalformedInputError(where(path, line) + ": invalid " + column + " '" + value + "'",
                              column);
}

// Iterate data rows, checking the column count
template <typename RowFn>
static void for_each_row(const std::string& path, const TableFormat& format,
                         size_t n_columns, const char* table_name, RowFn&& fn) {
    const char delim = format.delimiter ? format.delimiter : detect_delimiter(path);
    TableReader reader(path);
    std::string line;
    bool header_pending = format.has_header;

    while (reader.readline(line)) {
        if (line.empty() || line == "\r") continue;
        if (header_pending) {
            header_pending = false;
            continue;
        }
        auto fields = split_fields(line, delim);
        if (fields.size() != n_columns) {
            throw MalformedInputError(
                where(path, reader.line_number()) + ": " + table_name + " needs " +
                std::to_string(n_columns) + " columns, found " + std::to_string(fields.size()),
                "columns");
        }
        fn(fields, reader.line_number());
    }
}

std::vector<SubstrateRecord> read_kinase_table(const std::string& path, const TableFormat& format) {
    std::vector<SubstrateRecord> rows;
    for_each_row(path, format, 2, "kinase table",
        [&](std::vector<std::string>& f, size_t line) {
            if (f[0].empty()) {
                throw MalformedInputError(where(path, line) + ": empty kinase name", "kinase");
            }
            if (f[1] == "NA") f[1].clear();
            rows.push_back(SubstrateRecord::centered(std::move(f[0]), std::move(f[1])));
        });
    return rows;
}

std::vector<PeptideRecord> read_input_data(const std::string& path, const TableFormat& format) {
    std::vector<PeptideRecord> rows;
    for_each_row(path, format, 4, "input data",
        [&](std::vector<std::string>& f, size_t line) {
            PeptideRecord rec;
            rec.annotation = std::move(f[0]);
            rec.sequence = std::move(f[1]);
            rec.fold_change = parse_real(f[2], "fold_change", path, line);
            rec.p_value = parse_real(f[3], "p_value", path, line);
            if (!(rec.p_value >= 0.0 && rec.p_value <= 1.0)) {
                throw MalformedInputError(where(path, line) + ": p_value " + f[3] +
                                          " outside [0, 1]", "p_value");
            }
            rows.push_back(std::move(rec));
        });
    return rows;
}

// ---------------------------------------------------------------------------
// TableWriter
// ---------------------------------------------------------------------------

class TableWriter::Impl {
public:
    explicit Impl(const std::string& path) : path_(path) {
        if (path == "-") {
            file_ = stdout;
            owns_file_ = false;
        } else if (ends_with(path, ".gz")) {
            gz_ = gzopen(path.c_str(), "wb");
            if (!gz_) throw std::runtime_error("Failed to open output file: " + path);
        } else {
            file_ = std::fopen(path.c_str(), "w");
            if (!file_) throw std::runtime_error("Failed to open output file: " + path);
        }
    }

    ~Impl() {
        if (gz_) gzclose(gz_);
        if (file_ && owns_file_) std::fclose(file_);
    }

    void write(const std::string& text) {
        if (text.empty()) return;
        if (gz_) {
            if (gzwrite(gz_, text.data(), static_cast<unsigned>(text.size())) <= 0) {
                throw std::runtime_error("Write failed: " + path_);
            }
        } else if (std::fwrite(text.data(), 1, text.size(), file_) != text.size()) {
            throw std::runtime_error("Write failed: " + path_);
        }
    }

    void close() {
        if (gz_) {
            const int rc = gzclose(gz_);
            gz_ = nullptr;
            if (rc != Z_OK) throw std::runtime_error("Failed to close output file: " + path_);
        } else if (file_) {
            const int rc = owns_file_ ? std::fclose(file_) : std::fflush(file_);
            file_ = nullptr;
            if (rc != 0) throw std::runtime_error("Failed to close output file: " + path_);
        }
    }

private:
    std::string path_;
    gzFile gz_ = nullptr;
    FILE* file_ = nullptr;
    bool owns_file_ = true;
};

TableWriter::TableWriter(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {}

TableWriter::~TableWriter() = default;

void TableWriter::write(const std::string& text) { impl_->write(text); }
void TableWriter::close() { impl_->close(); }

// ---------------------------------------------------------------------------
// Writers
// ---------------------------------------------------------------------------

static void put_real(std::ostringstream& oss, double v) {
    if (std::isnan(v)) oss << "NA";
    else oss << std::setprecision(8) << v;
}

static void put_optional(std::ostringstream& oss, const std::optional<double>& v) {
    if (v) put_real(oss, *v);
    else oss << "NA";
}

void write_pwm_table(const PwmSet& pwms, const std::string& path) {
    TableWriter out(path);
    const Alphabet& alphabet = pwms.background.alphabet();
    out.write("kinase\tn_substrates\tposition\tresidue\tdepth\tprobability\tlog_odds\n");

    for (const auto& pwm : pwms.matrices) {
        std::ostringstream oss;
        for (size_t j = 0; j < pwm.substrate_length; ++j) {
            for (size_t a = 0; a < pwm.alphabet_size; ++a) {
                oss << pwm.kinase_id << '\t' << pwm.n_substrates_used << '\t'
                    << (static_cast<long>(j) - static_cast<long>(pwm.substrate_length / 2)) << '\t'
                    << alphabet.symbol(a) << '\t' << pwm.depth[j] << '\t';
                put_real(oss, pwm.probability(j, a));
                oss << '\t';
                put_real(oss, pwm.weight(j, a));
                oss << '\n';
            }
        }
        out.write(oss.str());
    }
    out.close();
}

void write_match_scores(const std::vector<MatchScore>& scores, const std::string& path) {
    TableWriter out(path);
    out.write("kinase\tpeptide\tpeptide_index\traw_score\tlog_odds_score\tp_value\n");

    constexpr size_t CHUNK = 4096;
    std::ostringstream oss;
    for (size_t i = 0; i < scores.size(); ++i) {
        const auto& ms = scores[i];
        oss << ms.kinase_id << '\t' << ms.peptide_id << '\t' << ms.peptide_index << '\t';
        put_real(oss, ms.raw_score);
        oss << '\t';
        put_real(oss, ms.log_odds_score);
        oss << '\t';
        put_real(oss, ms.empirical_p);
        oss << '\n';
        if ((i + 1) % CHUNK == 0) {
            out.write(oss.str());
            oss.str("");
        }
    }
    out.write(oss.str());
    out.close();
}

void write_swing_results(const std::vector<SwingResult>& results, const std::string& path) {
    TableWriter out(path);
    out.write("kinase\tn_positive\tn_negative\tn_network\tlog_ratio\tswing_score"
              "\tswing_zscore\tp_greater\tp_less\tn_permutations\n");

    std::ostringstream oss;
    for (const auto& r : results) {
        oss << r.kinase_id << '\t' << r.n_positive << '\t' << r.n_negative << '\t'
            << r.n_substrates_significant << '\t';
        put_optional(oss, r.log_ratio);
        oss << '\t';
        put_optional(oss, r.swing_score);
        oss << '\t';
        put_optional(oss, r.swing_zscore);
        oss << '\t';
        put_optional(oss, r.empirical_p);
        oss << '\t';
        put_optional(oss, r.empirical_p_less);
        oss << '\t' << r.n_permutations_run << '\n';
    }
    out.write(oss.str());
    out.close();
}

}  // namespace kinswing
