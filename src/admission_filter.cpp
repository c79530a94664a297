#include "pafclust/admission_filter.hpp"

#include <optional>

namespace pafclust {

AdmissionDecision admit(const ScoredPair& edge,
                        const SelfScoreTable& self_scores,
                        const AdmissionPolicy& policy) {
    AdmissionDecision d;

    if (edge.a == edge.b) {
        d.verdict = Admission::SELF_PAIR;
        return d;
    }

    if (policy.no_filters) {
        d.verdict = Admission::UNCONDITIONAL;
        return d;
    }

    if (policy.all_bests && edge.rank == 1) {
        d.verdict = Admission::BEST_RANK;
        return d;
    }

    // Reference is the larger of the two self-hit scores; a missing
    // self-hit is absent, not zero.
    const auto ref_a = self_scores.lookup(edge.a);
    const auto ref_b = self_scores.lookup(edge.b);
    d.missing_a = !ref_a.has_value();
    d.missing_b = !ref_b.has_value();

    std::optional<double> ref = ref_a;
    if (!ref || (ref_b && *ref_b > *ref)) {
        ref = ref_b;
    }

    // A non-positive reference cannot normalize anything
    if (ref && *ref > 0.0 && edge.score / *ref > policy.bsr_threshold) {
        d.verdict = Admission::SCORE_RATIO;
    } else {
        d.verdict = Admission::REJECTED;
    }
    return d;
}

const char* admission_to_string(Admission verdict) {
    switch (verdict) {
        case Admission::SELF_PAIR: return "self-pair";
        case Admission::UNCONDITIONAL: return "unconditional";
        case Admission::BEST_RANK: return "best-rank";
        case Admission::SCORE_RATIO: return "score-ratio";
        default: return "rejected";
    }
}

}  // namespace pafclust
