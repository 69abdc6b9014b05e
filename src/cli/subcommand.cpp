#include "subcommand.hpp"
#include "kinswing/version.h"
#include <algorithm>
#include <iostream>

namespace kinswing {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    if (find(name)) return;
    CommandEntry entry{name, description, order, std::move(fn)};
    auto pos = std::upper_bound(commands_.begin(), commands_.end(), order,
        [](int o, const CommandEntry& e) { return o < e.order; });
    commands_.insert(pos, std::move(entry));
}

const SubcommandRegistry::CommandEntry* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return &cmd;
    }
    return nullptr;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const CommandEntry* cmd = find(name);
    if (!cmd) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'kinswing --help' for usage information.\n";
        return 1;
    }
    return cmd->fn(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "kinswing v" << KINSWING_VERSION << "\n";
    std::cout << "Kinase activity prediction from phosphoproteomics (PWM matching + swing)\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t max_len = 0;
    for (const auto& cmd : commands_) {
        max_len = std::max(max_len, cmd.name.length());
    }
    for (const auto& cmd : commands_) {
        std::cout << "  " << cmd.name << std::string(max_len + 2 - cmd.name.length(), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

void register_builtin_commands() {
    auto& registry = SubcommandRegistry::instance();
    registry.register_command("build-pwm", "Build kinase PWMs from known substrates",
                              cmd_build_pwm, 1);
    registry.register_command("score", "Score peptides against kinase PWMs",
                              cmd_score, 2);
    registry.register_command("run", "Full pipeline: PWMs, scoring and swing scores",
                              cmd_run, 3);
}

}  // namespace cli
}  // namespace kinswing
