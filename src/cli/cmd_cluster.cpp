// pafclust cluster: single-linkage clusters from a PAF hit table
//
// Loads self-hit scores for the species set, runs the paralogue, RBH and
// threshold passes over every genome pair, then writes the clusters with two
// or more members and the job manifest.

#include "subcommand.hpp"
#include "args.hpp"
#include "pafclust/cluster_builder.hpp"
#include "pafclust/cluster_writer.hpp"
#include "pafclust/errors.hpp"
#include "pafclust/log_utils.hpp"
#include "pafclust/output_file.hpp"
#include "pafclust/paf_edge_source.hpp"
#include "pafclust/partition_emitter.hpp"
#include "pafclust/run_summary.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pafclust {
namespace cli {

namespace {

constexpr uint64_t MAX_REPORTED_MISSING = 10;

void print_parameters(const ClusterOptions& opts) {
    const ClusterConfig& c = opts.config;
    std::cerr << "parameters...\n";
    std::cerr << "  paf            : " << opts.paf_file << "\n";
    std::cerr << "  cache_rows     : " << (opts.cache_rows ? 1 : 0) << "\n";
    std::cerr << "  species_set    : " << format_genome_set(c.species_set) << "\n";
    std::cerr << "  BRH            : " << (c.include_rbh ? 1 : 0) << "\n";
    std::cerr << "  all_blast_hits : " << (c.no_filters ? 1 : 0) << "\n";
    std::cerr << "  all_bests      : " << (c.all_bests ? 1 : 0) << "\n";
    std::cerr << "  bsr_threshold  : " << std::fixed << std::setprecision(3)
              << c.bsr_threshold << "\n";
    std::cerr.unsetf(std::ios_base::floatfield);
}

void print_pass(const PassStats& p) {
    using log_utils::format_count;
    std::cerr << "  " << format_count(p.clusters_after) << " clusters so far\n";
    std::cerr << "  " << format_count(p.members_after) << " members in registry\n";
    if (p.phase == RunPhase::RBH_PASS) {
        std::cerr << "  " << log_utils::format_duration_ms(p.elapsed_ms) << " to process "
                  << format_count(p.edges_processed) << " BRH PAFs\n";
        return;
    }
    const uint64_t other = p.admitted_score_ratio + p.admitted_unconditional;
    std::cerr << "  " << log_utils::format_duration_ms(p.elapsed_ms) << " to process "
              << format_count(p.edges_processed) << " PAFs => "
              << format_count(p.edges_admitted) << " picked ("
              << format_count(p.admitted_best_rank) << " best + "
              << format_count(other) << " threshold)\n";
    if (p.missing_self_hits > 0) {
        std::cerr << "  " << format_count(p.missing_self_hits) << " missing self-hits\n";
    }
}

}  // namespace

int cmd_cluster(int argc, char* argv[]) {
    ClusterOptions opts;
    try {
        opts = parse_cluster_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'pafclust cluster --help' for usage.\n";
        }
        return e.exit_code();
    }

    const bool verbose = opts.verbose;
    if (verbose) print_parameters(opts);

    auto t_start = std::chrono::steady_clock::now();

    try {
        std::unique_ptr<PafFileEdgeSource> source;
        try {
            source = std::make_unique<PafFileEdgeSource>(opts.paf_file, opts.threads,
                                                         opts.cache_rows);
        } catch (const std::exception& e) {
            throw PhaseError(RunPhase::SCORE_LOADING, opts.config.species_set, e.what());
        }

        // Outputs are created up front so an unwritable path fails before
        // clustering; nothing is renamed into place unless emission commits.
        std::unique_ptr<TsvClusterWriter> writer;
        std::unique_ptr<JobManifestWriter> jobs;
        std::unique_ptr<OutputFile> summary;
        try {
            writer = std::make_unique<TsvClusterWriter>(opts.output_file);
            if (!opts.jobs_file.empty()) {
                jobs = std::make_unique<JobManifestWriter>(opts.jobs_file);
            }
            if (!opts.summary_file.empty()) {
                summary = std::make_unique<OutputFile>(opts.summary_file);
            }
        } catch (const std::exception& e) {
            throw PhaseError(RunPhase::PERSISTENCE, {}, e.what());
        }

        uint64_t missing_reported = 0;
        ClusterRunCallbacks callbacks;
        if (verbose) {
            callbacks.on_scores_loaded = [](const ClusterRunStats& s) {
                std::cerr << "Loaded " << log_utils::format_count(s.self_score_members)
                          << " self-hit scores in "
                          << log_utils::format_duration_ms(s.score_loading_ms) << "\n";
            };
            callbacks.on_pass_start = [](RunPhase phase, const std::vector<GenomeId>& genomes) {
                std::cerr << run_phase_to_string(phase) << " " << format_genome_set(genomes) << "\n";
            };
            callbacks.on_pass_done = print_pass;
            callbacks.on_missing_self_hit = [&missing_reported](MemberId member) {
                if (missing_reported++ < MAX_REPORTED_MISSING) {
                    std::cerr << "  member " << member << " missing self-hit\n";
                }
            };
        }

        ClusterRun run = run_clustering(*source, opts.config, callbacks);

        if (verbose && missing_reported > MAX_REPORTED_MISSING) {
            std::cerr << "  " << log_utils::format_count(missing_reported)
                      << " missing self-hits in total\n";
        }

        if (verbose) {
            std::cerr << "Storing clusters\n";
            std::cerr << "  " << log_utils::format_count(run.registry.num_members())
                      << " members in registry\n";
            std::cerr << "  " << log_utils::format_count(run.registry.num_clusters())
                      << " clusters generated\n";
        }

        EmitStats emitted = emit_partition(run.registry, *writer, jobs.get(),
                                           opts.config.first_cluster_id);

        // The summary reports a published partition, so it follows it
        if (summary) {
            std::ostringstream json;
            write_summary_json(json, opts.config, run.stats, emitted);
            try {
                summary->write(json.str());
                summary->commit();
            } catch (const std::exception& e) {
                throw PhaseError(RunPhase::PERSISTENCE, {},
                                 std::string("summary: ") + e.what());
            }
        }

        if (verbose) {
            print_run_report(std::cerr, run.stats, emitted);
            std::cerr << "Written: " << opts.output_file << "\n";
            if (!opts.jobs_file.empty()) std::cerr << "Written: " << opts.jobs_file << "\n";
            std::cerr << "Total time: "
                      << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now())
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct ClusterRegistrar {
        ClusterRegistrar() {
            SubcommandRegistry::instance().register_command(
                "cluster",
                "Single-linkage clusters from RBH and score-ratio filtered hits",
                cmd_cluster);
        }
    };
    static ClusterRegistrar registrar;
}

}  // namespace cli
}  // namespace pafclust
