#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace pafclust {

/**
 * Buffered output written to "<path>.tmp" and renamed to `path` on
 * commit().  Destroying an uncommitted file removes the temporary.
 *
 * commit() is finish() followed by publish().  Callers that move several
 * files into place together finish all of them first, so the only step
 * left to fail after the first rename is another rename.
 *
 * Compression follows the suffix of `path`: ".gz" uses zlib, ".zst" uses
 * zstd (needs a build with HAVE_ZSTD), anything else is written as is.
 */
class OutputFile {
public:
    enum class Codec { PLAIN, GZIP, ZSTD };

    // Throws std::runtime_error when the temporary cannot be created
    explicit OutputFile(const std::string& path, int compression_level = -1);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void write(const char* data, size_t len);
    void write(const std::string& s) { write(s.data(), s.size()); }

    // Flush and close the compressed stream, then check that the temporary
    // can replace `path`.  The temporary stays on disk until publish().
    void finish();

    // Move the finished temporary into place (finishes first if needed)
    void publish();

    void commit() {
        finish();
        publish();
    }

    // Remove a published file again; no-op when nothing was published
    void retract();

    bool finished() const { return finished_; }
    bool committed() const { return committed_; }
    Codec codec() const { return codec_; }
    const std::string& path() const { return path_; }
    const std::string& temp_path() const { return temp_path_; }

    static Codec codec_for_path(const std::string& path);

    // Byte sink behind the buffer, one per codec (defined in output_file.cpp)
    class Backend;

private:
    void flush_buffer();

    std::unique_ptr<Backend> backend_;
    std::string path_;
    std::string temp_path_;
    std::string buffer_;
    Codec codec_ = Codec::PLAIN;
    bool finished_ = false;
    bool broken_ = false;  // a finish() attempt threw
    bool committed_ = false;
};

}  // namespace pafclust
