#pragma once

#include "pafclust/edge_source.hpp"
#include "pafclust/paf_table.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace pafclust {

/**
 * Edge suppliers over a PAF hit table.  Subclasses provide a full scan of
 * the rows; each supplier call is one scan.
 */
class PafEdgeSource : public EdgeSource {
public:
    using RowFn = std::function<void(const PafRow& row)>;

    void for_each_self_hit(const std::vector<GenomeId>& genomes,
                           const SelfHitFn& fn) override;

    // Keeps the rank-1 rows between g1 and g2 in memory for the scan
    void for_each_rbh(GenomeId g1, GenomeId g2, const EdgeFn& fn) override;

    void for_each_candidate(const std::vector<GenomeId>& genomes,
                            const EdgeFn& fn) override;

protected:
    virtual void scan(const RowFn& fn) = 0;
};

/**
 * Rows read from a plain or gzip-compressed file.
 *
 * Without a row cache the file is read once per supplier call, which for n
 * genomes is 1 + n + n(n-1) reads.  With `cache_rows` the first scan keeps
 * every row in memory and later scans replay them.
 */
class PafFileEdgeSource : public PafEdgeSource {
public:
    // Throws std::runtime_error when the file cannot be opened
    explicit PafFileEdgeSource(std::string path, int threads = 0, bool cache_rows = false);

    const std::string& path() const { return path_; }

    // Rows read by the most recent scan
    uint64_t last_scan_rows() const { return last_scan_rows_; }

    // Times the file itself was read
    uint64_t file_reads() const { return file_reads_; }

protected:
    void scan(const RowFn& fn) override;

private:
    std::string path_;
    int threads_;
    bool cache_rows_;
    bool cached_ = false;
    std::vector<PafRow> rows_;
    uint64_t last_scan_rows_ = 0;
    uint64_t file_reads_ = 0;
};

// Rows held in memory
class PafMemoryEdgeSource : public PafEdgeSource {
public:
    PafMemoryEdgeSource() = default;
    explicit PafMemoryEdgeSource(std::vector<PafRow> rows) : rows_(std::move(rows)) {}

    void add(const PafRow& row) { rows_.push_back(row); }

    // Adds the row and its reverse (hit -> query) with the same score and rank
    void add_symmetric(const PafRow& row);

    const std::vector<PafRow>& rows() const { return rows_; }

protected:
    void scan(const RowFn& fn) override;

private:
    std::vector<PafRow> rows_;
};

}  // namespace pafclust
