#include "pafclust/cluster_builder.hpp"
#include "pafclust/log_utils.hpp"

#include <chrono>
#include <exception>

namespace pafclust {

uint64_t ClusterRunStats::total_processed() const {
    uint64_t n = 0;
    for (const auto& p : passes) n += p.edges_processed;
    return n;
}

uint64_t ClusterRunStats::total_admitted() const {
    uint64_t n = 0;
    for (const auto& p : passes) n += p.edges_admitted;
    return n;
}

uint64_t ClusterRunStats::total_missing_self_hits() const {
    uint64_t n = 0;
    for (const auto& p : passes) n += p.missing_self_hits;
    return n;
}

ClusterBuilder::ClusterBuilder(const SelfScoreTable& self_scores, const AdmissionPolicy& policy)
    : self_scores_(self_scores), policy_(policy) {}

void ClusterBuilder::add_rbh_edge(const ScoredPair& edge, PassStats& stats) {
    ++stats.edges_processed;
    if (edge.a == edge.b) {
        ++stats.self_pairs;
        return;
    }
    ++stats.edges_admitted;
    registry_.unite(edge.a, edge.b);
}

AdmissionDecision ClusterBuilder::offer_candidate(const ScoredPair& edge, PassStats& stats) {
    ++stats.edges_processed;
    const AdmissionDecision d = admit(edge, self_scores_, policy_);
    stats.missing_self_hits += static_cast<uint64_t>(d.missing_self_hits());

    switch (d.verdict) {
        case Admission::SELF_PAIR:
            ++stats.self_pairs;
            return d;
        case Admission::REJECTED:
            return d;
        case Admission::UNCONDITIONAL:
            ++stats.admitted_unconditional;
            break;
        case Admission::BEST_RANK:
            ++stats.admitted_best_rank;
            break;
        case Admission::SCORE_RATIO:
            ++stats.admitted_score_ratio;
            break;
    }
    ++stats.edges_admitted;
    registry_.unite(edge.a, edge.b);
    return d;
}

namespace {

using Clock = std::chrono::steady_clock;

void finish_pass(PassStats& stats, const ClusterRegistry& registry,
                 const Clock::time_point& start) {
    stats.clusters_after = registry.num_clusters();
    stats.members_after = registry.num_members();
    stats.elapsed_ms = log_utils::elapsed_ms(start, Clock::now());
}

}  // namespace

ClusterRun run_clustering(EdgeSource& source,
                          const ClusterConfig& config,
                          const ClusterRunCallbacks& callbacks) {
    config.validate();

    const auto t_run = Clock::now();
    ClusterRunStats stats;

    SelfScoreTable self_scores;
    try {
        const auto t0 = Clock::now();
        source.for_each_self_hit(config.species_set, [&](MemberId member, double score) {
            self_scores.insert(member, score);
            ++stats.self_hits_loaded;
        });
        stats.self_score_members = self_scores.size();
        stats.score_loading_ms = log_utils::elapsed_ms(t0, Clock::now());
    } catch (const std::exception& e) {
        throw PhaseError(RunPhase::SCORE_LOADING, config.species_set, e.what());
    }
    if (callbacks.on_scores_loaded) callbacks.on_scores_loaded(stats);

    ClusterBuilder builder(self_scores, config.admission_policy());

    auto threshold_pass = [&](const std::vector<GenomeId>& genomes) {
        PassStats ps;
        ps.phase = RunPhase::THRESHOLD_PASS;
        ps.genomes = genomes;
        if (callbacks.on_pass_start) callbacks.on_pass_start(ps.phase, genomes);
        const auto t0 = Clock::now();
        try {
            source.for_each_candidate(genomes, [&](const ScoredPair& edge) {
                const AdmissionDecision d = builder.offer_candidate(edge, ps);
                if (callbacks.on_missing_self_hit) {
                    if (d.missing_a) callbacks.on_missing_self_hit(edge.a);
                    if (d.missing_b) callbacks.on_missing_self_hit(edge.b);
                }
            });
        } catch (const std::exception& e) {
            throw PhaseError(RunPhase::THRESHOLD_PASS, genomes, e.what());
        }
        finish_pass(ps, builder.registry(), t0);
        if (callbacks.on_pass_done) callbacks.on_pass_done(ps);
        stats.passes.push_back(std::move(ps));
    };

    auto rbh_pass = [&](GenomeId g1, GenomeId g2) {
        PassStats ps;
        ps.phase = RunPhase::RBH_PASS;
        ps.genomes = {g1, g2};
        if (callbacks.on_pass_start) callbacks.on_pass_start(ps.phase, ps.genomes);
        const auto t0 = Clock::now();
        try {
            source.for_each_rbh(g1, g2, [&](const ScoredPair& edge) {
                builder.add_rbh_edge(edge, ps);
            });
        } catch (const std::exception& e) {
            throw PhaseError(RunPhase::RBH_PASS, ps.genomes, e.what());
        }
        finish_pass(ps, builder.registry(), t0);
        if (callbacks.on_pass_done) callbacks.on_pass_done(ps);
        stats.passes.push_back(std::move(ps));
    };

    const std::vector<GenomeId>& species = config.species_set;
    for (size_t i = 0; i < species.size(); ++i) {
        threshold_pass({species[i]});
        for (size_t j = i + 1; j < species.size(); ++j) {
            if (config.include_rbh) rbh_pass(species[i], species[j]);
            threshold_pass({species[i], species[j]});
        }
    }

    stats.elapsed_ms = log_utils::elapsed_ms(t_run, Clock::now());

    ClusterRun run;
    run.registry = builder.take_registry();
    run.stats = std::move(stats);
    return run;
}

}  // namespace pafclust
