#pragma once

#include "pafclust/admission_filter.hpp"
#include "pafclust/types.hpp"

#include <cstdint>
#include <vector>

namespace pafclust {

/**
 * Parameters of one clustering run.
 * validate() throws ConfigError; run_clustering() calls it before reading
 * any edge.
 */
struct ClusterConfig {
    std::vector<GenomeId> species_set;  // genomes to cluster, in processing order
    bool include_rbh = true;            // run the reciprocal-best-hit passes
    bool no_filters = false;            // admit every candidate hit
    bool all_bests = false;             // admit every rank-1 candidate hit
    double bsr_threshold = 0.25;        // blast score ratio cutoff (exclusive)
    uint64_t first_cluster_id = 1;      // external id given to the first emitted cluster

    void validate() const;

    AdmissionPolicy admission_policy() const {
        AdmissionPolicy p;
        p.no_filters = no_filters;
        p.all_bests = all_bests;
        p.bsr_threshold = bsr_threshold;
        return p;
    }
};

}  // namespace pafclust
