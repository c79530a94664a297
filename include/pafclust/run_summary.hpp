#pragma once

#include "pafclust/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace pafclust {

struct ClusterConfig;
struct ClusterRunStats;
struct EmitStats;

// Cluster counts by member count: 2, 3-5, 6-10, 11-50, 51-100, 101-500, >500
class ClusterSizeHistogram {
public:
    static constexpr size_t NUM_BINS = 7;

    void add(size_t cluster_size);

    uint64_t count(size_t bin) const { return counts_[bin]; }
    static const char* bin_label(size_t bin);

private:
    std::array<uint64_t, NUM_BINS> counts_{};
};

// Human-readable end-of-run report
void print_run_report(std::ostream& os,
                      const ClusterRunStats& run,
                      const EmitStats& emitted);

// Run parameters and counters as JSON
void write_summary_json(std::ostream& os,
                        const ClusterConfig& config,
                        const ClusterRunStats& run,
                        const EmitStats& emitted);

}  // namespace pafclust
