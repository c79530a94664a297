#include "pafclust/cluster_registry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pafclust {

ClusterHandle ClusterRegistry::create_singleton(MemberId member) {
    if (arena_.size() >= static_cast<size_t>(NO_CLUSTER)) {
        throw std::length_error("ClusterRegistry: cluster handle space exhausted");
    }
    const auto handle = static_cast<ClusterHandle>(arena_.size());
    arena_.emplace_back();
    arena_.back().members.push_back(member);
    owner_.emplace(member, handle);
    ++live_clusters_;
    return handle;
}

ClusterHandle ClusterRegistry::find(MemberId member) {
    auto it = owner_.find(member);
    if (it != owner_.end()) return it->second;
    return create_singleton(member);
}

std::optional<ClusterHandle> ClusterRegistry::lookup(MemberId member) const {
    auto it = owner_.find(member);
    if (it == owner_.end()) return std::nullopt;
    return it->second;
}

ClusterHandle ClusterRegistry::unite(MemberId a, MemberId b) {
    ClusterHandle keep = find(a);
    ClusterHandle drop = find(b);
    if (keep == drop) return keep;

    if (arena_[keep].members.size() < arena_[drop].members.size()) {
        std::swap(keep, drop);
    }

    std::vector<MemberId>& into = arena_[keep].members;
    std::vector<MemberId>& from = arena_[drop].members;
    into.reserve(into.size() + from.size());
    for (MemberId m : from) {
        owner_[m] = keep;
        into.push_back(m);
    }

    // Release the storage of the absorbed record, not just its size
    std::vector<MemberId>().swap(from);
    arena_[drop].live = false;
    --live_clusters_;
    return keep;
}

bool ClusterRegistry::same_cluster(MemberId a, MemberId b) const {
    auto ia = owner_.find(a);
    if (ia == owner_.end()) return false;
    auto ib = owner_.find(b);
    if (ib == owner_.end()) return false;
    return ia->second == ib->second;
}

std::vector<ClusterView> ClusterRegistry::clusters() const {
    std::vector<ClusterView> out;
    out.reserve(live_clusters_);
    for (size_t h = 0; h < arena_.size(); ++h) {
        const ClusterRecord& rec = arena_[h];
        if (!rec.live) continue;
        ClusterView view;
        view.handle = static_cast<ClusterHandle>(h);
        view.representative = rec.members.front();
        view.members = rec.members;
        out.push_back(std::move(view));
    }
    return out;
}

const std::vector<MemberId>& ClusterRegistry::members(ClusterHandle handle) const {
    if (handle >= arena_.size()) {
        throw std::out_of_range("ClusterRegistry: unknown cluster handle " +
                                std::to_string(handle));
    }
    return arena_[handle].members;
}

MemberId ClusterRegistry::representative(ClusterHandle handle) const {
    if (!is_live(handle)) {
        throw std::out_of_range("ClusterRegistry: no live cluster with handle " +
                                std::to_string(handle));
    }
    return arena_[handle].members.front();
}

}  // namespace pafclust
