#pragma once

/**
 * @file admission_filter.hpp
 * @brief Decide which threshold-candidate hits become clustering edges
 *
 * Policies in order of precedence:
 *   1. unconditional ("all hits"): every pair except self-pairs
 *   2. best rank: pairs with rank == 1, when enabled
 *   3. blast score ratio: score / max(self[a], self[b]) > threshold
 *
 * Reciprocal best hits never go through this filter.
 */

#include "pafclust/self_score_table.hpp"
#include "pafclust/types.hpp"

#include <cstdint>

namespace pafclust {

struct AdmissionPolicy {
    bool no_filters = false;      // admit every non-self pair
    bool all_bests = false;       // admit every rank-1 pair
    double bsr_threshold = 0.25;  // strict lower bound on score / reference
};

enum class Admission : uint8_t {
    REJECTED,
    SELF_PAIR,
    UNCONDITIONAL,
    BEST_RANK,
    SCORE_RATIO
};

struct AdmissionDecision {
    Admission verdict = Admission::REJECTED;
    bool missing_a = false;  // a had no self-hit when the ratio was evaluated
    bool missing_b = false;

    bool admitted() const {
        return verdict == Admission::UNCONDITIONAL ||
               verdict == Admission::BEST_RANK ||
               verdict == Admission::SCORE_RATIO;
    }

    int missing_self_hits() const {
        return (missing_a ? 1 : 0) + (missing_b ? 1 : 0);
    }
};

AdmissionDecision admit(const ScoredPair& edge,
                        const SelfScoreTable& self_scores,
                        const AdmissionPolicy& policy);

const char* admission_to_string(Admission verdict);

}  // namespace pafclust
