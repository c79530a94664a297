#pragma once

#include <cstdint>
#include <functional>
#include <utility>

namespace pafclust {

// Sequence member (peptide) identifier
using MemberId = uint64_t;

// Genome / source-group identifier
using GenomeId = uint32_t;

// Index of a cluster record in the registry arena
using ClusterHandle = uint32_t;

/**
 * One pairwise hit offered to the clustering driver.
 * rank is the 1-based position of b among a's hits by descending score.
 */
struct ScoredPair {
    MemberId a = 0;
    MemberId b = 0;
    double score = 0.0;
    uint32_t rank = 0;
};

namespace detail {

// splitmix64 finalizer, used to spread member ids over hash buckets
inline uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

}  // namespace detail

// Ordered (query, hit) member pair, hashable
struct MemberPair {
    MemberId first = 0;
    MemberId second = 0;

    bool operator==(const MemberPair& o) const {
        return first == o.first && second == o.second;
    }
};

struct MemberPairHash {
    size_t operator()(const MemberPair& p) const {
        return static_cast<size_t>(
            detail::splitmix64(p.first ^ detail::splitmix64(p.second)));
    }
};

}  // namespace pafclust
