#ifndef PAFCLUST_CLI_ARGS_HPP
#define PAFCLUST_CLI_ARGS_HPP

#include "pafclust/config.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace pafclust {
namespace cli {

// Thrown by the parser instead of calling exit(): help/version (code 0)
// and argument errors (code 1, message to print)
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct ClusterOptions {
    std::string paf_file;                       // PAF hit table (.tsv or .tsv.gz)
    std::string output_file = "clusters.tsv";   // cluster membership (.gz/.zst compress)
    std::string jobs_file;                      // job manifest, one cluster id per line
    std::string summary_file;                   // run summary (JSON format)
    ClusterConfig config;
    int threads = 0;                            // decompression threads, 0 = auto
    bool cache_rows = false;                    // read the hit table once, keep rows in memory
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Print usage/help of the cluster command to stdout
void print_cluster_usage(const char* program_name);

// "1,2,3" -> {1, 2, 3}; throws ParseArgsExit on an empty or invalid id
std::vector<GenomeId> parse_species_set(const std::string& value);

// Parse `cluster` arguments (argv[0] is the command name).
// Throws ParseArgsExit with code 0 for --help/--version and code 1 for
// errors, including an invalid configuration.
ClusterOptions parse_cluster_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace pafclust

#endif  // PAFCLUST_CLI_ARGS_HPP
