#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace pafclust {

/**
 * Line-oriented reader for plain or gzip-compressed text files.
 *
 * Compressed input is decoded by rapidgzip when available, otherwise by
 * zlib, which also passes plain files through unchanged.
 */
class LineReader {
public:
    // Throws std::runtime_error when the file cannot be opened.
    // threads: decompression threads for rapidgzip, 0 = hardware concurrency
    explicit LineReader(const std::string& path, int threads = 0);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Next line without its newline (and without a trailing '\r').
    // Returns false at end of file; throws std::runtime_error on a read error.
    bool next(std::string& line);

    // 1-based number of the line last returned
    uint64_t line_number() const { return line_number_; }

    const std::string& path() const { return path_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
    uint64_t line_number_ = 0;
};

}  // namespace pafclust
