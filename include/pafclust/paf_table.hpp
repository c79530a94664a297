#pragma once

/**
 * @file paf_table.hpp
 * @brief Peptide-align-feature (PAF) hit table
 *
 * Tab-separated, one hit per line:
 *
 *   qmember_id  hmember_id  qgenome_db_id  hgenome_db_id  score  hit_rank  [...]
 *
 * Columns after the sixth are ignored.  Blank lines and lines starting with
 * '#' are skipped, and so is a first line whose first field is not a number
 * (column header).  A self-hit is a row with qmember_id == hmember_id.
 */

#include "pafclust/line_reader.hpp"
#include "pafclust/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace pafclust {

struct PafRow {
    MemberId qmember_id = 0;
    MemberId hmember_id = 0;
    GenomeId qgenome_db_id = 0;
    GenomeId hgenome_db_id = 0;
    double score = 0.0;
    uint32_t hit_rank = 0;

    bool is_self_hit() const { return qmember_id == hmember_id; }

    ScoredPair to_pair() const {
        ScoredPair p;
        p.a = qmember_id;
        p.b = hmember_id;
        p.score = score;
        p.rank = hit_rank;
        return p;
    }
};

constexpr size_t PAF_MIN_FIELDS = 6;

// Parse one data line.  Throws std::invalid_argument naming the bad field.
PafRow parse_paf_line(std::string_view line);

// True for lines that carry no row (blank or '#' comment)
bool is_paf_comment(std::string_view line);

/**
 * Streaming reader over a PAF table file.
 * Errors carry "<path>:<line>:" in their message.
 */
class PafTableReader {
public:
    explicit PafTableReader(const std::string& path, int threads = 0);

    // Next row; false at end of file.  Throws std::runtime_error on a
    // malformed line.
    bool next(PafRow& row);

    uint64_t rows_read() const { return rows_read_; }

private:
    LineReader reader_;
    std::string line_;
    uint64_t rows_read_ = 0;
};

}  // namespace pafclust
