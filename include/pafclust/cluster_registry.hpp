#pragma once

/**
 * @file cluster_registry.hpp
 * @brief Disjoint-set partition of members for single-linkage clustering
 *
 * Clusters live in an arena indexed by ClusterHandle; every member seen so
 * far maps to the handle of the cluster that owns it.  Merging moves the
 * members of the smaller cluster into the larger one (union by size) and
 * retires the emptied record, so a member is owned by exactly one live
 * cluster at any time.
 *
 * Handles are never reused.  A retired handle stays valid as an index but
 * owns no members.
 */

#include "pafclust/types.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pafclust {

// Snapshot of one live cluster
struct ClusterView {
    ClusterHandle handle = 0;
    MemberId representative = 0;
    std::vector<MemberId> members;  // insertion order
};

class ClusterRegistry {
public:
    static constexpr ClusterHandle NO_CLUSTER = std::numeric_limits<ClusterHandle>::max();

    ClusterRegistry() = default;

    // Current cluster of a member.  An unseen member gets a new singleton cluster.
    ClusterHandle find(MemberId member);

    // Current cluster of a member, without creating one
    std::optional<ClusterHandle> lookup(MemberId member) const;

    // Put a and b in the same cluster and return it.  When both already
    // share a cluster nothing changes.  The larger cluster survives; on equal
    // size the cluster of a survives.
    ClusterHandle unite(MemberId a, MemberId b);

    // True when both members have been seen and share a cluster
    bool same_cluster(MemberId a, MemberId b) const;

    // Live clusters in creation order
    std::vector<ClusterView> clusters() const;

    // Members of a cluster; empty for a retired handle.  Throws
    // std::out_of_range for a handle never issued.
    const std::vector<MemberId>& members(ClusterHandle handle) const;

    // First member of a live cluster.  Throws std::out_of_range for a
    // retired or unknown handle.
    MemberId representative(ClusterHandle handle) const;

    bool is_live(ClusterHandle handle) const {
        return handle < arena_.size() && arena_[handle].live;
    }

    size_t num_members() const { return owner_.size(); }
    size_t num_clusters() const { return live_clusters_; }

    // Clusters ever created, retired ones included
    size_t num_records() const { return arena_.size(); }

    void reserve(size_t expected_members) { owner_.reserve(expected_members); }

private:
    struct ClusterRecord {
        std::vector<MemberId> members;
        bool live = true;
    };

    ClusterHandle create_singleton(MemberId member);

    std::vector<ClusterRecord> arena_;
    std::unordered_map<MemberId, ClusterHandle> owner_;
    size_t live_clusters_ = 0;
};

}  // namespace pafclust
