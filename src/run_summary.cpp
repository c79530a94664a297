#include "pafclust/run_summary.hpp"
#include "pafclust/cluster_builder.hpp"
#include "pafclust/config.hpp"
#include "pafclust/log_utils.hpp"
#include "pafclust/partition_emitter.hpp"
#include "pafclust/version.h"

#include <iomanip>
#include <ostream>

namespace pafclust {

void ClusterSizeHistogram::add(size_t cluster_size) {
    size_t bin;
    if (cluster_size <= 2) bin = 0;
    else if (cluster_size <= 5) bin = 1;
    else if (cluster_size <= 10) bin = 2;
    else if (cluster_size <= 50) bin = 3;
    else if (cluster_size <= 100) bin = 4;
    else if (cluster_size <= 500) bin = 5;
    else bin = 6;
    ++counts_[bin];
}

const char* ClusterSizeHistogram::bin_label(size_t bin) {
    static const char* const labels[NUM_BINS] = {
        "2", "3-5", "6-10", "11-50", "51-100", "101-500", ">500"
    };
    return bin < NUM_BINS ? labels[bin] : "?";
}

void print_run_report(std::ostream& os,
                      const ClusterRunStats& run,
                      const EmitStats& emitted) {
    using log_utils::format_count;

    os << "Clustering summary:\n";
    os << "  Self-hit members:     " << format_count(run.self_score_members) << "\n";
    os << "  Passes:               " << run.passes.size() << "\n";
    os << "  Edges processed:      " << format_count(run.total_processed()) << "\n";
    os << "  Edges admitted:       " << format_count(run.total_admitted()) << "\n";
    os << "  Missing self-hits:    " << format_count(run.total_missing_self_hits()) << "\n";
    os << "  Clusters emitted:     " << format_count(emitted.clusters_emitted) << "\n";
    os << "  Members emitted:      " << format_count(emitted.members_emitted) << "\n";
    os << "  Largest cluster:      " << format_count(emitted.largest_cluster) << "\n";
    if (emitted.clusters_emitted > 0) {
        os << "  Cluster ids:          " << emitted.first_cluster_id << "-"
           << emitted.last_cluster_id << "\n";
    }
    os << "  Cluster sizes:\n";
    for (size_t b = 0; b < ClusterSizeHistogram::NUM_BINS; ++b) {
        os << "    " << std::setw(8) << std::left << ClusterSizeHistogram::bin_label(b)
           << std::right << format_count(emitted.histogram.count(b)) << "\n";
    }
    os << "  Clustering time:      " << log_utils::format_duration_ms(run.elapsed_ms) << "\n";
}

void write_summary_json(std::ostream& os,
                        const ClusterConfig& config,
                        const ClusterRunStats& run,
                        const EmitStats& emitted) {
    os << "{\n";
    os << "  \"version\": \"" << PAFCLUST_VERSION << "\",\n";

    os << "  \"parameters\": {\n";
    os << "    \"species_set\": [";
    for (size_t i = 0; i < config.species_set.size(); ++i) {
        os << (i ? ", " : "") << config.species_set[i];
    }
    os << "],\n";
    os << "    \"brh\": " << (config.include_rbh ? "true" : "false") << ",\n";
    os << "    \"all_blast_hits\": " << (config.no_filters ? "true" : "false") << ",\n";
    os << "    \"all_bests\": " << (config.all_bests ? "true" : "false") << ",\n";
    os << std::fixed << std::setprecision(3);
    os << "    \"bsr_threshold\": " << config.bsr_threshold << "\n";
    os << "  },\n";

    os << "  \"self_hits\": {\n";
    os << "    \"rows\": " << run.self_hits_loaded << ",\n";
    os << "    \"members\": " << run.self_score_members << ",\n";
    os << "    \"elapsed_ms\": " << run.score_loading_ms << "\n";
    os << "  },\n";

    os << "  \"passes\": [\n";
    for (size_t i = 0; i < run.passes.size(); ++i) {
        const PassStats& p = run.passes[i];
        os << "    {\"phase\": \""
           << (p.phase == RunPhase::RBH_PASS ? "rbh" : "threshold") << "\", ";
        os << "\"species\": [";
        for (size_t g = 0; g < p.genomes.size(); ++g) {
            os << (g ? ", " : "") << p.genomes[g];
        }
        os << "], ";
        os << "\"processed\": " << p.edges_processed << ", ";
        os << "\"admitted\": " << p.edges_admitted << ", ";
        os << "\"best_rank\": " << p.admitted_best_rank << ", ";
        os << "\"score_ratio\": " << p.admitted_score_ratio << ", ";
        os << "\"unconditional\": " << p.admitted_unconditional << ", ";
        os << "\"missing_self_hits\": " << p.missing_self_hits << ", ";
        os << "\"clusters_after\": " << p.clusters_after << ", ";
        os << "\"members_after\": " << p.members_after << ", ";
        os << "\"elapsed_ms\": " << p.elapsed_ms << "}";
        os << (i + 1 < run.passes.size() ? ",\n" : "\n");
    }
    os << "  ],\n";

    os << "  \"totals\": {\n";
    os << "    \"edges_processed\": " << run.total_processed() << ",\n";
    os << "    \"edges_admitted\": " << run.total_admitted() << ",\n";
    os << "    \"missing_self_hits\": " << run.total_missing_self_hits() << ",\n";
    os << "    \"clusters_emitted\": " << emitted.clusters_emitted << ",\n";
    os << "    \"members_emitted\": " << emitted.members_emitted << ",\n";
    os << "    \"singletons_dropped\": " << emitted.singletons_dropped << ",\n";
    os << "    \"largest_cluster\": " << emitted.largest_cluster << ",\n";
    os << "    \"elapsed_ms\": " << run.elapsed_ms << "\n";
    os << "  },\n";

    os << "  \"cluster_sizes\": {";
    for (size_t b = 0; b < ClusterSizeHistogram::NUM_BINS; ++b) {
        os << (b ? ", " : "") << "\"" << ClusterSizeHistogram::bin_label(b) << "\": "
           << emitted.histogram.count(b);
    }
    os << "}\n";
    os << "}\n";
}

}  // namespace pafclust
