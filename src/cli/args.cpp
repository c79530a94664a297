#include "args.hpp"
#include "pafclust/errors.hpp"
#include "pafclust/version.h"

#include <iostream>
#include <limits>
#include <string>

namespace pafclust {
namespace cli {

void print_version() {
    std::cout << "pafclust " << PAFCLUST_VERSION << "\n";
}

void print_cluster_usage(const char* program_name) {
    std::cout << "pafclust v" << PAFCLUST_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " cluster -i <hits.paf> -s <genome,...> [options]\n\n";
    std::cout << "Build single-linkage clusters from reciprocal best hits and\n";
    std::cout << "score-ratio filtered hits between the genomes of a species set.\n\n";
    std::cout << "Required:\n";
    std::cout << "  -i, --paf <file>         PAF hit table (.tsv or .tsv.gz), columns:\n";
    std::cout << "                           qmember hmember qgenome hgenome score hit_rank\n";
    std::cout << "  -s, --species-set <ids>  Comma-separated genome ids, e.g. 1,2,3,14\n";
    std::cout << "\nOutput:\n";
    std::cout << "  -o, --output <file>      Cluster membership table (default: clusters.tsv)\n";
    std::cout << "                           .gz compresses with zlib, .zst with zstd\n";
    std::cout << "  --jobs <file>            Job manifest, one cluster id per line\n";
    std::cout << "  --summary <file>         Run statistics (JSON format)\n";
    std::cout << "  --first-cluster-id <N>   Id of the first emitted cluster (default: 1)\n";
    std::cout << "\nEdge admission:\n";
    std::cout << "  --no-brh                 Skip the reciprocal best hit passes\n";
    std::cout << "  --all-hits               Admit every non-self hit\n";
    std::cout << "  --all-bests              Admit every rank-1 hit\n";
    std::cout << "  --bsr-threshold <f>      Blast score ratio cutoff (default: 0.25)\n";
    std::cout << "\nInput:\n";
    std::cout << "  --cache-rows             Keep the hit table in memory after the first read.\n";
    std::cout << "                           Without it the table is read once per pass,\n";
    std::cout << "                           1 + n + n(n-1) times for n genomes\n";
    std::cout << "  -t, --threads <int>      Decompression threads (default: auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " cluster -i paf.tsv.gz -s 1,2,3 -o clusters.tsv.gz --jobs jobs.txt\n";
    std::cout << "  " << program_name << " cluster -i paf.tsv -s 7 --all-bests --bsr-threshold 0.33\n";
}

std::vector<GenomeId> parse_species_set(const std::string& value) {
    std::vector<GenomeId> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        const std::string token = value.substr(start, comma - start);
        if (token.empty()) {
            throw ParseArgsExit(1, "Error: Empty genome id in species set '" + value + "'");
        }
        try {
            size_t idx = 0;
            unsigned long long parsed = std::stoull(token, &idx);
            if (idx != token.size() || token[0] == '-' ||
                parsed > std::numeric_limits<GenomeId>::max()) {
                throw ParseArgsExit(1, "Error: Invalid genome id '" + token + "'");
            }
            out.push_back(static_cast<GenomeId>(parsed));
        } catch (const ParseArgsExit&) {
            throw;
        } catch (const std::exception&) {
            throw ParseArgsExit(1, "Error: Invalid genome id '" + token + "'");
        }
        start = comma + 1;
    }
    return out;
}

ClusterOptions parse_cluster_args(int argc, char* argv[]) {
    ClusterOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_u64 = [&](const std::string& flag, const std::string& value) -> uint64_t {
            try {
                size_t idx = 0;
                uint64_t parsed = std::stoull(value, &idx);
                if (idx != value.size() || value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_cluster_usage("pafclust");
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--paf") {
            opts.paf_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--jobs") {
            opts.jobs_file = require_value(arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(arg);
        } else if (arg == "-s" || arg == "--species-set") {
            opts.config.species_set = parse_species_set(require_value(arg));
        } else if (arg == "--first-cluster-id") {
            opts.config.first_cluster_id = parse_u64(arg, require_value(arg));
        } else if (arg == "--no-brh") {
            opts.config.include_rbh = false;
        } else if (arg == "--all-hits") {
            opts.config.no_filters = true;
        } else if (arg == "--all-bests") {
            opts.config.all_bests = true;
        } else if (arg == "--bsr-threshold") {
            opts.config.bsr_threshold = parse_double(arg, require_value(arg));
        } else if (arg == "-t" || arg == "--threads") {
            opts.threads = parse_int(arg, require_value(arg));
            if (opts.threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "--cache-rows") {
            opts.cache_rows = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.paf_file.empty()) {
        throw ParseArgsExit(1, "Error: No PAF table specified (--paf)");
    }
    if (opts.output_file.empty()) {
        throw ParseArgsExit(1, "Error: Empty --output path");
    }

    try {
        opts.config.validate();
    } catch (const ConfigError& e) {
        throw ParseArgsExit(1, std::string("Error: ") + e.what());
    }

    return opts;
}

}  // namespace cli
}  // namespace pafclust
