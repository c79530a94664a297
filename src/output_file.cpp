#include "pafclust/output_file.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <vector>
#include <zlib.h>

#ifdef HAVE_ZSTD
#include <zstd.h>
#endif

namespace pafclust {

namespace {

constexpr size_t BUFFER_SIZE = 1024 * 1024;  // 1MB

bool ends_with(const std::string& s, const char* suffix) {
    const size_t n = std::strlen(suffix);
    return s.size() > n && s.compare(s.size() - n, n, suffix) == 0;
}

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

}  // namespace

class OutputFile::Backend {
public:
    virtual ~Backend() = default;
    virtual void write(const char* data, size_t len) = 0;
    virtual void finish() = 0;
};

namespace {

class PlainBackend : public OutputFile::Backend {
public:
    explicit PlainBackend(const std::string& path) : path_(path) {
        file_ = std::fopen(path.c_str(), "wb");
        if (!file_) throw std::runtime_error(errno_message("Cannot create", path));
    }

    ~PlainBackend() override {
        if (file_) std::fclose(file_);
    }

    void write(const char* data, size_t len) override {
        if (std::fwrite(data, 1, len, file_) != len) {
            throw std::runtime_error(errno_message("Write failed on", path_));
        }
    }

    void finish() override {
        FILE* f = file_;
        file_ = nullptr;
        if (std::fclose(f) != 0) {
            throw std::runtime_error(errno_message("Close failed on", path_));
        }
    }

protected:
    FILE* file_ = nullptr;
    std::string path_;
};

class GzipBackend : public OutputFile::Backend {
public:
    GzipBackend(const std::string& path, int level) : path_(path) {
        std::string mode = "wb";
        if (level >= 0 && level <= 9) mode += static_cast<char>('0' + level);
        gz_ = gzopen(path.c_str(), mode.c_str());
        if (!gz_) throw std::runtime_error(errno_message("Cannot create", path));
        gzbuffer(gz_, static_cast<unsigned>(BUFFER_SIZE));
    }

    ~GzipBackend() override {
        if (gz_) gzclose(gz_);
    }

    void write(const char* data, size_t len) override {
        while (len > 0) {
            const unsigned chunk = static_cast<unsigned>(std::min<size_t>(len, 1u << 30));
            if (gzwrite(gz_, data, chunk) != static_cast<int>(chunk)) {
                int err = Z_OK;
                throw std::runtime_error("zlib write failed on " + path_ + ": " +
                                         gzerror(gz_, &err));
            }
            data += chunk;
            len -= chunk;
        }
    }

    void finish() override {
        gzFile gz = gz_;
        gz_ = nullptr;
        if (gzclose(gz) != Z_OK) {
            throw std::runtime_error("zlib close failed on " + path_);
        }
    }

private:
    gzFile gz_ = nullptr;
    std::string path_;
};

#ifdef HAVE_ZSTD
class ZstdBackend : public PlainBackend {
public:
    ZstdBackend(const std::string& path, int level)
        : PlainBackend(path), out_(ZSTD_CStreamOutSize()) {
        cctx_ = ZSTD_createCCtx();
        if (!cctx_) throw std::runtime_error("ZSTD_createCCtx failed");
        const size_t rc = ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel,
                                                 level > 0 ? level : 3);
        if (ZSTD_isError(rc)) {
            ZSTD_freeCCtx(cctx_);
            throw std::runtime_error(std::string("ZSTD compression level rejected: ") +
                                     ZSTD_getErrorName(rc));
        }
    }

    ~ZstdBackend() override {
        ZSTD_freeCCtx(cctx_);
    }

    void write(const char* data, size_t len) override {
        ZSTD_inBuffer in{data, len, 0};
        while (in.pos < in.size) {
            drain(in, ZSTD_e_continue);
        }
    }

    void finish() override {
        ZSTD_inBuffer in{nullptr, 0, 0};
        while (drain(in, ZSTD_e_end) != 0) {}
        PlainBackend::finish();
    }

private:
    size_t drain(ZSTD_inBuffer& in, ZSTD_EndDirective mode) {
        ZSTD_outBuffer out{out_.data(), out_.size(), 0};
        const size_t remaining = ZSTD_compressStream2(cctx_, &out, &in, mode);
        if (ZSTD_isError(remaining)) {
            throw std::runtime_error(std::string("ZSTD compression failed: ") +
                                     ZSTD_getErrorName(remaining));
        }
        PlainBackend::write(out_.data(), out.pos);
        return remaining;
    }

    ZSTD_CCtx* cctx_ = nullptr;
    std::vector<char> out_;
};
#endif  // HAVE_ZSTD

}  // namespace

OutputFile::Codec OutputFile::codec_for_path(const std::string& path) {
    if (ends_with(path, ".gz")) return Codec::GZIP;
    if (ends_with(path, ".zst")) return Codec::ZSTD;
    return Codec::PLAIN;
}

OutputFile::OutputFile(const std::string& path, int compression_level)
    : path_(path), temp_path_(path + ".tmp"), codec_(codec_for_path(path)) {
    switch (codec_) {
        case Codec::GZIP:
            backend_ = std::make_unique<GzipBackend>(temp_path_, compression_level);
            break;
        case Codec::ZSTD:
#ifdef HAVE_ZSTD
            backend_ = std::make_unique<ZstdBackend>(temp_path_, compression_level);
            break;
#else
            throw std::runtime_error("Cannot write " + path +
                                     ": binary was built without ZSTD support");
#endif
        case Codec::PLAIN:
            backend_ = std::make_unique<PlainBackend>(temp_path_);
            break;
    }
    buffer_.reserve(BUFFER_SIZE);
}

OutputFile::~OutputFile() {
    if (committed_) return;
    backend_.reset();
    std::remove(temp_path_.c_str());
}

void OutputFile::write(const char* data, size_t len) {
    if (finished_ || broken_) {
        throw std::logic_error("OutputFile: write after finish on " + path_);
    }
    if (buffer_.size() + len > BUFFER_SIZE) {
        flush_buffer();
        if (len > BUFFER_SIZE) {
            backend_->write(data, len);
            return;
        }
    }
    buffer_.append(data, len);
}

void OutputFile::flush_buffer() {
    if (buffer_.empty()) return;
    backend_->write(buffer_.data(), buffer_.size());
    buffer_.clear();
}

void OutputFile::finish() {
    if (finished_) return;
    if (broken_) {
        throw std::logic_error("OutputFile: " + path_ + " failed to finish earlier");
    }
    broken_ = true;
    flush_buffer();
    backend_->finish();

    // rename() cannot replace a directory
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec)) {
        throw std::runtime_error("Cannot replace " + path_ + ": is a directory");
    }
    broken_ = false;
    finished_ = true;
}

void OutputFile::publish() {
    if (committed_) return;
    finish();
    if (std::rename(temp_path_.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error(errno_message("Cannot rename " + temp_path_ + " to", path_));
    }
    committed_ = true;
}

void OutputFile::retract() {
    if (!committed_) return;
    if (std::remove(path_.c_str()) != 0 && errno != ENOENT) {
        throw std::runtime_error(errno_message("Cannot remove", path_));
    }
    committed_ = false;
}

}  // namespace pafclust
