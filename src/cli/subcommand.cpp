#include "subcommand.hpp"
#include "pafclust/version.h"

#include <algorithm>
#include <ostream>
#include <utility>

namespace pafclust {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn) {
    commands_[name] = Command{description, std::move(fn)};
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return commands_.count(name) != 0;
}

int SubcommandRegistry::dispatch(int argc, char* argv[], std::ostream& out,
                                 std::ostream& err) const {
    if (argc < 2) {
        print_help(argv[0], err);
        return 1;
    }

    const std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        print_help(argv[0], out);
        return 0;
    }
    if (first == "--version" || first == "-V") {
        out << "pafclust " << PAFCLUST_VERSION << "\n";
        return 0;
    }

    auto it = commands_.find(first);
    if (it == commands_.end()) {
        err << "Unknown command: " << first << "\n";
        err << "Run '" << argv[0] << " --help' for usage information.\n";
        return 1;
    }
    return it->second.fn(argc - 1, argv + 1);
}

void SubcommandRegistry::print_help(const char* program_name, std::ostream& out) const {
    out << "pafclust v" << PAFCLUST_VERSION << "\n";
    out << "Single-linkage clustering of PAF hit tables\n\n";
    out << "Usage: " << program_name << " <command> [options]\n\n";
    out << "Commands:\n";

    size_t width = 0;
    for (const auto& [name, cmd] : commands_) width = std::max(width, name.size());
    for (const auto& [name, cmd] : commands_) {
        out << "  " << name << std::string(width + 2 - name.size(), ' ') << cmd.description
            << "\n";
    }

    out << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace pafclust
