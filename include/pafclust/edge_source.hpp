#pragma once

/**
 * @file edge_source.hpp
 * @brief Suppliers of self-hit scores and pairwise edges
 *
 * Every supplier streams its records through a callback and must not
 * require the caller to hold the whole stream.  Exceptions thrown by a
 * supplier (I/O, malformed input) propagate to the caller unchanged.
 */

#include "pafclust/types.hpp"

#include <functional>
#include <vector>

namespace pafclust {

class EdgeSource {
public:
    using SelfHitFn = std::function<void(MemberId member, double score)>;
    using EdgeFn = std::function<void(const ScoredPair& edge)>;

    virtual ~EdgeSource() = default;

    // One (member, self-hit score) per member of the given genomes
    virtual void for_each_self_hit(const std::vector<GenomeId>& genomes,
                                   const SelfHitFn& fn) = 0;

    // Hits g1 -> g2 that are rank 1 in both directions.  Nothing for g1 == g2.
    virtual void for_each_rbh(GenomeId g1, GenomeId g2, const EdgeFn& fn) = 0;

    // Non-self hits with both members in `genomes`.  With more than one
    // genome, hits within a single genome are left out.
    virtual void for_each_candidate(const std::vector<GenomeId>& genomes,
                                    const EdgeFn& fn) = 0;
};

}  // namespace pafclust
