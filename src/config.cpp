#include "pafclust/config.hpp"
#include "pafclust/errors.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

namespace pafclust {

void ClusterConfig::validate() const {
    if (species_set.empty()) {
        throw ConfigError("no species set given");
    }

    std::unordered_set<GenomeId> seen;
    for (GenomeId g : species_set) {
        if (!seen.insert(g).second) {
            throw ConfigError("genome " + std::to_string(g) +
                              " listed twice in species set " +
                              format_genome_set(species_set));
        }
    }

    if (!std::isfinite(bsr_threshold) || bsr_threshold < 0.0) {
        throw ConfigError("BSR threshold must be a finite value >= 0, got " +
                          std::to_string(bsr_threshold));
    }
}

}  // namespace pafclust
