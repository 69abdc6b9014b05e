// table_io_backend.cpp
// Implements make_gz_reader(), the only translation unit that includes
// rapidgzip headers.

#ifdef HAVE_RAPIDGZIP
#include <rapidgzip/rapidgzip.hpp>
#include <filereader/Standard.hpp>
#endif

#include "kinswing/gz_reader_base.hpp"
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace {

#ifdef HAVE_RAPIDGZIP
class GzLineReaderRapidgzip : public kinswing::GzLineReader {
public:
    explicit GzLineReaderRapidgzip(const std::string& path)
        : buf_(GZBUF_SIZE), buf_pos_(0), buf_used_(0), eof_(false) {
        reader_ = std::make_unique<rapidgzip::ParallelGzipReader<>>(
            std::make_unique<rapidgzip::StandardFileReader>(path),
            0,          // threads: 0 = hardware_concurrency
            GZBUF_SIZE
        );
    }

    bool readline(std::string& line) override {
        line.clear();
        while (true) {
            for (size_t i = buf_pos_; i < buf_used_; ++i) {
                if (buf_[i] == '\n') {
                    line.append(buf_.data() + buf_pos_, i - buf_pos_);
                    buf_pos_ = i + 1;
                    return true;
                }
            }
            if (buf_pos_ < buf_used_)
                line.append(buf_.data() + buf_pos_, buf_used_ - buf_pos_);
            buf_pos_ = buf_used_ = 0;
            if (eof_ || !refill()) return !line.empty();
        }
    }

private:
    bool refill() {
        const size_t n = reader_->read(buf_.data(), buf_.size());
        if (n == 0) { eof_ = true; return false; }
        buf_used_ = n;
        buf_pos_ = 0;
        return true;
    }

    std::unique_ptr<rapidgzip::ParallelGzipReader<>> reader_;
    std::vector<char> buf_;
    size_t buf_pos_;
    size_t buf_used_;
    bool eof_;
};
#endif  // HAVE_RAPIDGZIP

}  // anonymous namespace

namespace kinswing {

bool is_gzip_file(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return false;
    unsigned char magic[2] = {0, 0};
    const bool gz = (std::fread(magic, 1, 2, f) == 2) &&
                    magic[0] == 0x1f && magic[1] == 0x8b;
    std::fclose(f);
    return gz;
}

std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path) {
#ifdef HAVE_RAPIDGZIP
    if (is_gzip_file(path))
        return std::make_unique<GzLineReaderRapidgzip>(path);
#else
    (void)path;
#endif
    return nullptr;  // caller falls back to zlib
}

}  // namespace kinswing
