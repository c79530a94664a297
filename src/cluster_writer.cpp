#include "pafclust/cluster_writer.hpp"

namespace pafclust {

TsvClusterWriter::TsvClusterWriter(const std::string& path, bool write_header)
    : out_(path) {
    if (write_header) out_.write("cluster_id\tmember_id\n");
}

void TsvClusterWriter::store(uint64_t cluster_id, const std::vector<MemberId>& members) {
    const std::string id = std::to_string(cluster_id);
    for (MemberId m : members) {
        line_.clear();
        line_ += id;
        line_ += '\t';
        line_ += std::to_string(m);
        line_ += '\n';
        out_.write(line_);
    }
}

void TsvClusterWriter::prepare() {
    out_.finish();
}

void TsvClusterWriter::commit() {
    out_.publish();
}

void TsvClusterWriter::retract() {
    out_.retract();
}

JobManifestWriter::JobManifestWriter(const std::string& path)
    : out_(path) {}

void JobManifestWriter::dispatch(uint64_t cluster_id) {
    out_.write(std::to_string(cluster_id) + "\n");
}

void JobManifestWriter::prepare() {
    out_.finish();
}

void JobManifestWriter::commit() {
    out_.publish();
}

}  // namespace pafclust
