#pragma once
// Abstract gzip line reader; keeps rapidgzip headers out of every TU but
// src/line_reader_backend.cpp.

#include <cstddef>
#include <memory>
#include <string>

namespace pafclust {

class GzLineReader {
public:
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

    virtual ~GzLineReader() = default;

    // Read one line (without trailing newline) into `line`. Returns false on EOF.
    virtual bool readline(std::string& line) = 0;
};

// Returns nullptr when built without HAVE_RAPIDGZIP or when `path` is not
// gzip-compressed; the caller then reads through zlib.
std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path, int threads);

}  // namespace pafclust
