#include "pafclust/paf_edge_source.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace pafclust {

namespace {

bool contains_genome(const std::vector<GenomeId>& genomes, GenomeId g) {
    return std::find(genomes.begin(), genomes.end(), g) != genomes.end();
}

}  // namespace

void PafEdgeSource::for_each_self_hit(const std::vector<GenomeId>& genomes,
                                      const SelfHitFn& fn) {
    scan([&](const PafRow& row) {
        if (row.is_self_hit() && contains_genome(genomes, row.qgenome_db_id)) {
            fn(row.qmember_id, row.score);
        }
    });
}

void PafEdgeSource::for_each_rbh(GenomeId g1, GenomeId g2, const EdgeFn& fn) {
    if (g1 == g2) return;

    // Forward rank-1 hits g1 -> g2 in table order, and the set of reverse
    // rank-1 hits g2 -> g1 to check them against.
    std::vector<PafRow> forward;
    std::unordered_set<MemberPair, MemberPairHash> reverse;

    scan([&](const PafRow& row) {
        if (row.hit_rank != 1) return;
        if (row.qgenome_db_id == g1 && row.hgenome_db_id == g2) {
            forward.push_back(row);
        } else if (row.qgenome_db_id == g2 && row.hgenome_db_id == g1) {
            reverse.insert(MemberPair{row.qmember_id, row.hmember_id});
        }
    });

    for (const PafRow& row : forward) {
        if (reverse.count(MemberPair{row.hmember_id, row.qmember_id})) {
            fn(row.to_pair());
        }
    }
}

void PafEdgeSource::for_each_candidate(const std::vector<GenomeId>& genomes,
                                       const EdgeFn& fn) {
    const bool cross_only = genomes.size() > 1;
    scan([&](const PafRow& row) {
        if (row.is_self_hit()) return;
        if (!contains_genome(genomes, row.qgenome_db_id) ||
            !contains_genome(genomes, row.hgenome_db_id)) {
            return;
        }
        if (cross_only && row.qgenome_db_id == row.hgenome_db_id) return;
        fn(row.to_pair());
    });
}

PafFileEdgeSource::PafFileEdgeSource(std::string path, int threads, bool cache_rows)
    : path_(std::move(path)), threads_(threads), cache_rows_(cache_rows) {
    std::ifstream probe(path_);
    if (!probe) {
        throw std::runtime_error("Cannot open PAF table: " + path_);
    }
}

void PafFileEdgeSource::scan(const RowFn& fn) {
    if (cached_) {
        for (const PafRow& row : rows_) {
            fn(row);
        }
        last_scan_rows_ = rows_.size();
        return;
    }

    // A scan that throws leaves the cache empty
    rows_.clear();
    ++file_reads_;
    PafTableReader reader(path_, threads_);
    PafRow row;
    while (reader.next(row)) {
        if (cache_rows_) rows_.push_back(row);
        fn(row);
    }
    last_scan_rows_ = reader.rows_read();
    cached_ = cache_rows_;
}

void PafMemoryEdgeSource::add_symmetric(const PafRow& row) {
    rows_.push_back(row);
    PafRow rev = row;
    std::swap(rev.qmember_id, rev.hmember_id);
    std::swap(rev.qgenome_db_id, rev.hgenome_db_id);
    rows_.push_back(rev);
}

void PafMemoryEdgeSource::scan(const RowFn& fn) {
    for (const PafRow& row : rows_) {
        fn(row);
    }
}

}  // namespace pafclust
