#include "args.hpp"
#include "kinswing/sequence_scorer.hpp"
#include "kinswing/version.h"
#include <iostream>
#include <algorithm>
#include <string>

namespace kinswing {
namespace cli {

PipelineOptions Options::pipeline_options() const {
    PipelineOptions p;
    p.wild_card = wild_card;
    p.substrate_length = substrate_length;
    p.remove_center = remove_center;
    p.pwm_pseudo = pwm_pseudo;
    p.background = parse_background_kind(background);
    p.n = n;
    p.force_trim = force_trim;
    p.seed = seed;
    p.pseudo_count = pseudo_count;
    p.p_cut_pwm = p_cut_pwm;
    p.p_cut_fc = p_cut_fc;
    p.permutations = permutations;
    p.verbose = verbose;
    p.threads = num_threads;
    return p;
}

TableFormat Options::table_format() const {
    TableFormat f;
    f.has_header = has_header;
    return f;
}

void print_version() {
    std::cout << "kinswing " << KINSWING_VERSION << "\n";
}

void print_usage(const std::string& command) {
    const bool needs_input = command != "build-pwm";
    std::cout << "Usage: kinswing " << command << " -k <kinase_table>"
              << (needs_input ? " -i <input_data>" : "") << " [options]\n\n";
    std::cout << "Input:\n";
    std::cout << "  -k, --kinase-table <file>  Kinase/substrate table (kinase, centred sequence)\n";
    if (needs_input) {
        std::cout << "  -i, --input <file>         Phosphopeptides (annotation, centred sequence,\n";
        std::cout << "                             fold change, p-value)\n";
    }
    std::cout << "  --no-header                Input tables have no header row\n";
    std::cout << "  -o, --output <file>        Output TSV, .gz compresses (default: stdout)\n";
    if (command == "run") {
        std::cout << "  --pwm-out <file>           Also write the PWM table\n";
        std::cout << "  --scores-out <file>        Also write the PWM match scores\n";
    }
    std::cout << "\nPWM building:\n";
    std::cout << "  --wild-card <c>            Out-of-protein symbol (default: _)\n";
    std::cout << "  --substrate-length <int>   Substrate window length (default: 15)\n";
    std::cout << "  --remove-center <c>        Drop substrates with this centre residue\n";
    std::cout << "  --pwm-pseudo <f>           Pseudo value for log-odds (default: 0.01)\n";
    if (needs_input) {
        std::cout << "\nScoring:\n";
        std::cout << "  --background <name>        Null background, only 'random' (default)\n";
        std::cout << "  -n <int>                   Random peptides per kinase (default: 1000)\n";
        std::cout << "  --force-trim               Not supported, ignored\n";
        std::cout << "  --seed <int|none>          Random seed (default: 1234)\n";
    }
    if (command == "run") {
        std::cout << "\nSwing:\n";
        std::cout << "  --pseudo-count <f>         Log-ratio pseudo count (default: 1)\n";
        std::cout << "  --p-cut-pwm <f>            PWM match significance (default: 0.05)\n";
        std::cout << "  --p-cut-fc <f>             Fold-change significance (default: 0.05)\n";
        std::cout << "  --permutations <int>       Network permutations, <= 1 disables (default: 100)\n";
    }
    std::cout << "\n";
    std::cout << "  -t, --threads <int>        Number of threads (default: 1)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -V, --version              Show version and exit\n";
    std::cout << "  -h, --help                 Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    if (argc > 0) opts.command = argv[0];

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') throw ParseArgsExit(1);
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) throw ParseArgsExit(1);
                return parsed;
            } catch (const ParseArgsExit&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) throw ParseArgsExit(1);
                return parsed;
            } catch (const ParseArgsExit&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_real = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size()) throw ParseArgsExit(1);
                return parsed;
            } catch (const ParseArgsExit&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        auto parse_symbol = [&](const std::string& flag, const std::string& value) -> char {
            if (value.size() != 1) {
                throw ParseArgsExit(1, "Error: " + flag + " takes a single character: " + value);
            }
            return value[0];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(opts.command);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-k" || arg == "--kinase-table") {
            opts.kinase_table = require_value(arg);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_data = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--pwm-out") {
            opts.pwm_out = require_value(arg);
        } else if (arg == "--scores-out") {
            opts.scores_out = require_value(arg);
        } else if (arg == "--no-header") {
            opts.has_header = false;
        } else if (arg == "--wild-card") {
            opts.wild_card = parse_symbol(arg, require_value(arg));
        } else if (arg == "--substrate-length") {
            opts.substrate_length = parse_size(arg, require_value(arg));
            if (opts.substrate_length < 1) {
                throw ParseArgsExit(1, "Error: --substrate-length must be >= 1");
            }
        } else if (arg == "--remove-center") {
            std::string value = require_value(arg);
            if (value == "false" || value == "FALSE") {
                opts.remove_center.reset();
            } else {
                opts.remove_center = parse_symbol(arg, value);
            }
        } else if (arg == "--pwm-pseudo") {
            opts.pwm_pseudo = parse_real(arg, require_value(arg));
        } else if (arg == "--background") {
            opts.background = require_value(arg);
            if (opts.background != "random") {
                throw ParseArgsExit(1, "Error: Unknown background '" + opts.background +
                                       "' (only 'random' is supported)");
            }
        } else if (arg == "-n") {
            opts.n = parse_size(arg, require_value(arg));
            if (opts.n < 1) {
                throw ParseArgsExit(1, "Error: -n must be >= 1");
            }
        } else if (arg == "--force-trim") {
            opts.force_trim = true;
        } else if (arg == "--seed") {
            std::string value = require_value(arg);
            if (value == "none" || value == "NULL") {
                opts.seed.reset();
            } else {
                opts.seed = static_cast<uint64_t>(parse_size(arg, value));
            }
        } else if (arg == "--pseudo-count") {
            opts.pseudo_count = parse_real(arg, require_value(arg));
        } else if (arg == "--p-cut-pwm") {
            opts.p_cut_pwm = parse_real(arg, require_value(arg));
        } else if (arg == "--p-cut-fc") {
            opts.p_cut_fc = parse_real(arg, require_value(arg));
        } else if (arg == "--permutations") {
            std::string value = require_value(arg);
            opts.permutations = (value == "false" || value == "FALSE") ? 0 : parse_int(arg, value);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.kinase_table.empty()) {
        throw ParseArgsExit(1, "Error: No kinase table specified (-k)");
    }
    if (opts.command != "build-pwm" && opts.input_data.empty()) {
        throw ParseArgsExit(1, "Error: No input data specified (-i)");
    }

    return opts;
}

}  // namespace cli
}  // namespace kinswing
