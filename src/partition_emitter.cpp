#include "pafclust/partition_emitter.hpp"
#include "pafclust/errors.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace pafclust {

EmitStats emit_partition(const ClusterRegistry& registry,
                         ClusterSink& sink,
                         FanoutSink* fanout,
                         uint64_t first_cluster_id) {
    EmitStats stats;
    stats.first_cluster_id = first_cluster_id;

    uint64_t next_id = first_cluster_id;
    for (const ClusterView& cluster : registry.clusters()) {
        if (cluster.members.size() < 2) {
            ++stats.singletons_dropped;
            continue;
        }

        const uint64_t cluster_id = next_id++;
        try {
            sink.store(cluster_id, cluster.members);
            if (fanout) fanout->dispatch(cluster_id);
        } catch (const std::exception& e) {
            throw PhaseError(RunPhase::PERSISTENCE, {},
                             "cluster " + std::to_string(cluster_id) + ": " + e.what());
        }

        ++stats.clusters_emitted;
        stats.members_emitted += cluster.members.size();
        stats.largest_cluster = std::max(stats.largest_cluster, cluster.members.size());
        stats.last_cluster_id = cluster_id;
        stats.histogram.add(cluster.members.size());
    }

    try {
        sink.prepare();
        if (fanout) fanout->prepare();
        sink.commit();
    } catch (const std::exception& e) {
        throw PhaseError(RunPhase::PERSISTENCE, {}, e.what());
    }

    if (fanout) {
        try {
            fanout->commit();
        } catch (const std::exception& e) {
            std::string cause = e.what();
            try {
                sink.retract();
            } catch (const std::exception& undo) {
                cause += "; cluster table left in place: ";
                cause += undo.what();
            }
            throw PhaseError(RunPhase::PERSISTENCE, {}, cause);
        }
    }
    return stats;
}

}  // namespace pafclust
