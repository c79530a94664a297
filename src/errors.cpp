#include "pafclust/errors.hpp"

#include <utility>

namespace pafclust {

const char* run_phase_to_string(RunPhase phase) {
    switch (phase) {
        case RunPhase::SCORE_LOADING: return "score loading";
        case RunPhase::RBH_PASS: return "RBH pass";
        case RunPhase::THRESHOLD_PASS: return "threshold pass";
        case RunPhase::PERSISTENCE: return "persistence";
    }
    return "unknown phase";
}

std::string format_genome_set(const std::vector<GenomeId>& genomes) {
    std::string out = "(";
    for (size_t i = 0; i < genomes.size(); ++i) {
        if (i) out += ',';
        out += std::to_string(genomes[i]);
    }
    out += ')';
    return out;
}

static std::string phase_message(RunPhase phase,
                                 const std::vector<GenomeId>& genomes,
                                 const std::string& cause) {
    std::string msg = run_phase_to_string(phase);
    msg += " failed";
    if (!genomes.empty()) {
        msg += " for species " + format_genome_set(genomes);
    }
    msg += ": " + cause;
    return msg;
}

PhaseError::PhaseError(RunPhase phase, std::vector<GenomeId> genomes, const std::string& cause)
    : std::runtime_error(phase_message(phase, genomes, cause)),
      phase_(phase),
      genomes_(std::move(genomes)),
      cause_(cause) {}

}  // namespace pafclust
