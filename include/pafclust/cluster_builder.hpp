#pragma once

/**
 * @file cluster_builder.hpp
 * @brief Single-linkage clustering driver
 *
 * For a species set [g1 .. gn] the passes run in this order:
 *
 *   for each gi:
 *     threshold pass over {gi}           (paralogues)
 *     for each gj after gi:
 *       RBH pass (gi, gj)                (if enabled)
 *       threshold pass over {gi, gj}
 *
 * The order only affects throughput; the final partition does not depend
 * on it.  Self-hit scores for the whole set are loaded before the first
 * pass.
 */

#include "pafclust/admission_filter.hpp"
#include "pafclust/cluster_registry.hpp"
#include "pafclust/config.hpp"
#include "pafclust/edge_source.hpp"
#include "pafclust/errors.hpp"
#include "pafclust/self_score_table.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace pafclust {

// Counters of one RBH or threshold pass
struct PassStats {
    RunPhase phase = RunPhase::THRESHOLD_PASS;
    std::vector<GenomeId> genomes;

    uint64_t edges_processed = 0;
    uint64_t edges_admitted = 0;
    uint64_t admitted_unconditional = 0;
    uint64_t admitted_best_rank = 0;
    uint64_t admitted_score_ratio = 0;
    uint64_t self_pairs = 0;
    uint64_t missing_self_hits = 0;  // per missing endpoint

    size_t clusters_after = 0;
    size_t members_after = 0;
    int64_t elapsed_ms = 0;
};

// Counters of a whole run, returned by value
struct ClusterRunStats {
    uint64_t self_hits_loaded = 0;
    size_t self_score_members = 0;
    int64_t score_loading_ms = 0;
    std::vector<PassStats> passes;
    int64_t elapsed_ms = 0;

    uint64_t total_processed() const;
    uint64_t total_admitted() const;
    uint64_t total_missing_self_hits() const;
};

struct ClusterRunCallbacks {
    std::function<void(const ClusterRunStats&)> on_scores_loaded;
    std::function<void(RunPhase, const std::vector<GenomeId>&)> on_pass_start;
    std::function<void(const PassStats&)> on_pass_done;
    std::function<void(MemberId)> on_missing_self_hit;
};

/**
 * Applies edges to a registry: RBH edges directly, candidate edges through
 * the admission filter.  The self-score table is borrowed and must outlive
 * the builder.
 */
class ClusterBuilder {
public:
    ClusterBuilder(const SelfScoreTable& self_scores, const AdmissionPolicy& policy);

    void add_rbh_edge(const ScoredPair& edge, PassStats& stats);

    AdmissionDecision offer_candidate(const ScoredPair& edge, PassStats& stats);

    const ClusterRegistry& registry() const { return registry_; }

    ClusterRegistry take_registry() { return std::move(registry_); }

private:
    const SelfScoreTable& self_scores_;
    AdmissionPolicy policy_;
    ClusterRegistry registry_;
};

struct ClusterRun {
    ClusterRegistry registry;
    ClusterRunStats stats;
};

/**
 * Validate `config`, load self-hit scores, and run every pass.
 *
 * Throws ConfigError before reading any edge, and PhaseError when the
 * source fails; in both cases no partial registry is returned.
 */
ClusterRun run_clustering(EdgeSource& source,
                          const ClusterConfig& config,
                          const ClusterRunCallbacks& callbacks = ClusterRunCallbacks());

}  // namespace pafclust
