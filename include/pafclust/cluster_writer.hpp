#pragma once

#include "pafclust/output_file.hpp"
#include "pafclust/partition_emitter.hpp"

#include <string>

namespace pafclust {

/**
 * Cluster membership table, one "cluster_id<TAB>member_id" row per member,
 * rows of a cluster contiguous and in member insertion order.
 */
class TsvClusterWriter : public ClusterSink {
public:
    explicit TsvClusterWriter(const std::string& path, bool write_header = true);

    void store(uint64_t cluster_id, const std::vector<MemberId>& members) override;
    void prepare() override;
    void commit() override;
    void retract() override;

private:
    OutputFile out_;
    std::string line_;
};

// Job manifest for downstream per-cluster work, one "cluster_id" per line
class JobManifestWriter : public FanoutSink {
public:
    explicit JobManifestWriter(const std::string& path);

    void dispatch(uint64_t cluster_id) override;
    void prepare() override;
    void commit() override;

private:
    OutputFile out_;
};

}  // namespace pafclust
