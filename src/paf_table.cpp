#include "pafclust/paf_table.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace pafclust {

namespace {

// Split on tabs, up to max_fields views into `line`
size_t split_fields(std::string_view line, std::string_view* fields, size_t max_fields) {
    size_t n = 0;
    const char* p = line.data();
    const char* end = p + line.size();
    while (n < max_fields) {
        const char* tab = static_cast<const char*>(
            memchr(p, '\t', static_cast<size_t>(end - p)));
        if (!tab) tab = end;
        fields[n++] = std::string_view(p, static_cast<size_t>(tab - p));
        if (tab == end) break;
        p = tab + 1;
    }
    return n;
}

template <typename T>
T parse_integer_field(std::string_view value, const char* name) {
    T out = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto res = std::from_chars(begin, end, out);
    if (value.empty() || res.ec != std::errc() || res.ptr != end) {
        throw std::invalid_argument(std::string("invalid ") + name + " '" +
                                    std::string(value) + "'");
    }
    return out;
}

double parse_score_field(std::string_view value) {
    const std::string token(value);
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (token.empty() || end != begin + token.size() || errno == ERANGE ||
        !std::isfinite(parsed)) {
        throw std::invalid_argument("invalid score '" + token + "'");
    }
    return parsed;
}

bool starts_with_digit(std::string_view line) {
    return !line.empty() && line[0] >= '0' && line[0] <= '9';
}

}  // namespace

bool is_paf_comment(std::string_view line) {
    for (char c : line) {
        if (c == ' ' || c == '\t') continue;
        return c == '#';
    }
    return true;  // blank
}

PafRow parse_paf_line(std::string_view line) {
    std::string_view fields[PAF_MIN_FIELDS];
    const size_t n = split_fields(line, fields, PAF_MIN_FIELDS);
    if (n < PAF_MIN_FIELDS) {
        throw std::invalid_argument("expected " + std::to_string(PAF_MIN_FIELDS) +
                                    " tab-separated fields, found " + std::to_string(n));
    }

    PafRow row;
    row.qmember_id = parse_integer_field<MemberId>(fields[0], "qmember_id");
    row.hmember_id = parse_integer_field<MemberId>(fields[1], "hmember_id");
    row.qgenome_db_id = parse_integer_field<GenomeId>(fields[2], "qgenome_db_id");
    row.hgenome_db_id = parse_integer_field<GenomeId>(fields[3], "hgenome_db_id");
    row.score = parse_score_field(fields[4]);
    row.hit_rank = parse_integer_field<uint32_t>(fields[5], "hit_rank");
    return row;
}

PafTableReader::PafTableReader(const std::string& path, int threads)
    : reader_(path, threads) {}

bool PafTableReader::next(PafRow& row) {
    while (reader_.next(line_)) {
        if (is_paf_comment(line_)) continue;
        if (reader_.line_number() == 1 && !starts_with_digit(line_)) continue;  // header

        try {
            row = parse_paf_line(line_);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(reader_.path() + ":" +
                                     std::to_string(reader_.line_number()) + ": " +
                                     e.what());
        }
        ++rows_read_;
        return true;
    }
    return false;
}

}  // namespace pafclust
