#pragma once

#include "pafclust/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace pafclust {

// Invalid run configuration, raised before any edge is read
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RunPhase {
    SCORE_LOADING,
    RBH_PASS,
    THRESHOLD_PASS,
    PERSISTENCE
};

const char* run_phase_to_string(RunPhase phase);

/**
 * Fatal failure of one clustering phase.  Carries the phase and the genomes
 * being processed so a narrower batch can be re-run.
 */
class PhaseError : public std::runtime_error {
public:
    PhaseError(RunPhase phase, std::vector<GenomeId> genomes, const std::string& cause);

    RunPhase phase() const { return phase_; }
    const std::vector<GenomeId>& genomes() const { return genomes_; }
    const std::string& cause() const { return cause_; }

private:
    RunPhase phase_;
    std::vector<GenomeId> genomes_;
    std::string cause_;
};

// "(3,14)"
std::string format_genome_set(const std::vector<GenomeId>& genomes);

}  // namespace pafclust
