#pragma once

/**
 * @file partition_emitter.hpp
 * @brief Hand the final clusters to persistence and downstream scheduling
 */

#include "pafclust/cluster_registry.hpp"
#include "pafclust/run_summary.hpp"
#include "pafclust/types.hpp"

#include <cstdint>
#include <vector>

namespace pafclust {

// Receives each emitted cluster once
class ClusterSink {
public:
    virtual ~ClusterSink() = default;
    virtual void store(uint64_t cluster_id, const std::vector<MemberId>& members) = 0;
    // Finish everything that can fail short of publishing
    virtual void prepare() {}
    // Publish; results are authoritative only after it
    virtual void commit() {}
    // Undo a commit when a later part of the run failed to publish
    virtual void retract() {}
};

// Receives each emitted cluster id once its store has completed
class FanoutSink {
public:
    virtual ~FanoutSink() = default;
    virtual void dispatch(uint64_t cluster_id) = 0;
    virtual void prepare() {}
    virtual void commit() {}
};

struct EmitStats {
    uint64_t clusters_emitted = 0;
    uint64_t members_emitted = 0;
    uint64_t singletons_dropped = 0;
    uint64_t first_cluster_id = 0;
    uint64_t last_cluster_id = 0;  // meaningful when clusters_emitted > 0
    size_t largest_cluster = 0;
    ClusterSizeHistogram histogram;
};

/**
 * Emit every live cluster with at least two members, in creation order,
 * with ids first_cluster_id, first_cluster_id + 1, ...
 * `fanout` may be null.  Sink failures are rethrown as
 * PhaseError(RunPhase::PERSISTENCE).
 *
 * Both sinks are prepared before either commits.  If the fan-out fails to
 * commit after the sink did, the sink is retracted, so a failed run never
 * leaves a published partition behind.
 */
EmitStats emit_partition(const ClusterRegistry& registry,
                         ClusterSink& sink,
                         FanoutSink* fanout,
                         uint64_t first_cluster_id = 1);

}  // namespace pafclust
