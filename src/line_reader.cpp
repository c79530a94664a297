#include "pafclust/line_reader.hpp"
#include "pafclust/gz_reader_base.hpp"

#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace pafclust {

class LineReader::Impl {
public:
    std::unique_ptr<GzLineReader> rapid_;
    gzFile gz_file_ = nullptr;
    char buffer_[65536];

    bool open(const std::string& path, int threads) {
        rapid_ = make_gz_reader(path, threads);
        if (rapid_) return true;

        // zlib reads gzip and plain files alike
        gz_file_ = gzopen(path.c_str(), "rb");
        if (!gz_file_) return false;
        gzbuffer(gz_file_, GzLineReader::GZBUF_SIZE);
        return true;
    }

    bool getline(std::string& line) {
        if (rapid_) return rapid_->readline(line);

        line.clear();
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                return true;
            }
            // Line longer than the buffer, or last line without newline
            line.append(buffer_, len);
        }
        int err = Z_OK;
        const char* msg = gzerror(gz_file_, &err);
        if (err != Z_OK && err != Z_STREAM_END) {
            throw std::runtime_error(std::string("zlib read error: ") + msg);
        }
        return !line.empty();
    }

    ~Impl() {
        if (gz_file_) gzclose(gz_file_);
    }
};

LineReader::LineReader(const std::string& path, int threads)
    : impl_(std::make_unique<Impl>()), path_(path) {
    if (!impl_->open(path, threads)) {
        throw std::runtime_error("Failed to open file: " + path);
    }
}

LineReader::~LineReader() = default;

bool LineReader::next(std::string& line) {
    if (!impl_->getline(line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    ++line_number_;
    return true;
}

}  // namespace pafclust
