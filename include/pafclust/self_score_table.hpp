#pragma once

#include "pafclust/types.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace pafclust {

/**
 * Score of each member against itself, the reference for the blast score
 * ratio.  Filled once before clustering and only read afterwards.
 */
class SelfScoreTable {
public:
    // A repeated member keeps the last score offered
    void insert(MemberId member, double score) { scores_[member] = score; }

    std::optional<double> lookup(MemberId member) const {
        auto it = scores_.find(member);
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(MemberId member) const { return scores_.count(member) != 0; }

    size_t size() const { return scores_.size(); }
    bool empty() const { return scores_.empty(); }

    void reserve(size_t n) { scores_.reserve(n); }

private:
    std::unordered_map<MemberId, double> scores_;
};

}  // namespace pafclust
