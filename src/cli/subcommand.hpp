#ifndef KINSWING_CLI_SUBCOMMAND_HPP
#define KINSWING_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <vector>

namespace kinswing {
namespace cli {

// Handler receives argv starting at the command name
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Pipeline stages exposed on the command line, in workflow order
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
        SubcommandFn fn;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    // nullptr for unknown names
    const CommandEntry* find(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

    const std::vector<CommandEntry>& commands() const { return commands_; }

private:
    SubcommandRegistry() = default;
    std::vector<CommandEntry> commands_;  // kept sorted by order
};

// Registers build-pwm, score and run; safe to call more than once
void register_builtin_commands();

int cmd_build_pwm(int argc, char* argv[]);
int cmd_score(int argc, char* argv[]);
int cmd_run(int argc, char* argv[]);

}  // namespace cli
}  // namespace kinswing

#endif  // KINSWING_CLI_SUBCOMMAND_HPP
