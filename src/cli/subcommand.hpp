#ifndef PAFCLUST_CLI_SUBCOMMAND_HPP
#define PAFCLUST_CLI_SUBCOMMAND_HPP

#include <functional>
#include <iosfwd>
#include <map>
#include <string>

namespace pafclust {
namespace cli {

// Subcommand handler; argv[0] is the command name
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands registered at static initialization, listed by name
class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    void register_command(const std::string& name, const std::string& description,
                          SubcommandFn fn);

    bool has_command(const std::string& name) const;

    // Full command line of the program: help and version flags, then the
    // command named by argv[1].  Returns the process exit code.
    int dispatch(int argc, char* argv[], std::ostream& out, std::ostream& err) const;

    void print_help(const char* program_name, std::ostream& out) const;

private:
    struct Command {
        std::string description;
        SubcommandFn fn;
    };

    std::map<std::string, Command> commands_;
};

int cmd_cluster(int argc, char* argv[]);

}  // namespace cli
}  // namespace pafclust

#endif  // PAFCLUST_CLI_SUBCOMMAND_HPP
