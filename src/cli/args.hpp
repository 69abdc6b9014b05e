#ifndef KINSWING_CLI_ARGS_HPP
#define KINSWING_CLI_ARGS_HPP

#include "kinswing/pipeline.hpp"
#include "kinswing/table_io.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace kinswing {
namespace cli {

// Thrown by parse_args to end the command: 0 for --help/--version, 1 on errors
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int exit_code, std::string message = "")
        : exit_code_(exit_code), message_(std::move(message)) {}

    int exit_code() const { return exit_code_; }
    const std::string& message() const { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int exit_code_;
    std::string message_;
};

struct Options {
    std::string command;              // build-pwm, score or run
    std::string kinase_table;
    std::string input_data;
    std::string output_file = "-";    // "-" = stdout
    std::string pwm_out;              // run: optional intermediate tables
    std::string scores_out;
    bool has_header = true;

    // PWM building
    char wild_card = DEFAULT_WILD_CARD;
    size_t substrate_length = DEFAULT_SUBSTRATE_LENGTH;
    std::optional<char> remove_center;
    double pwm_pseudo = DEFAULT_PWM_PSEUDO;

    // Scoring
    std::string background = "random";
    size_t n = DEFAULT_NULL_SAMPLES;
    bool force_trim = false;
    std::optional<uint64_t> seed = DEFAULT_SEED;  // "none" = fresh per kinase

    // Swing
    double pseudo_count = DEFAULT_SWING_PSEUDO;
    double p_cut_pwm = DEFAULT_P_CUT_PWM;
    double p_cut_fc = DEFAULT_P_CUT_FC;
    int permutations = DEFAULT_PERMUTATIONS;

    int num_threads = 1;
    bool verbose = false;

    PipelineOptions pipeline_options() const;
    TableFormat table_format() const;
};

// Print version string to stdout
void print_version();

// Print usage of `command` to stdout
void print_usage(const std::string& command);

// Parse the arguments of one subcommand (argv[0] is the command name).
// Throws ParseArgsExit for --help/--version (code 0) and errors (code 1).
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace kinswing

#endif  // KINSWING_CLI_ARGS_HPP
