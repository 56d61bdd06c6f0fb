#include "dump/dump_reader.hpp"
#include <bzlib.h>
#include <zlib.h>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace wdi {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::FILE* open_file_or_throw(const std::string& path) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        throw DumpOpenError("Cannot open archive " + path + ": " + std::strerror(errno));
    }
    return file;
}

} // anonymous namespace

// ============================================================================
// PlainFileSource
// ============================================================================

PlainFileSource::PlainFileSource(const std::string& path)
    : file_(open_file_or_throw(path)), path_(path) {}

PlainFileSource::~PlainFileSource() {
    if (file_) {
        std::fclose(file_);
    }
}

size_t PlainFileSource::read(char* buffer, size_t capacity) {
    size_t n = std::fread(buffer, 1, capacity, file_);
    if (n == 0 && std::ferror(file_)) {
        throw DumpReadError("Read error on " + path_);
    }
    return n;
}

// ============================================================================
// GzipFileSource
// ============================================================================

GzipFileSource::GzipFileSource(const std::string& path) : path_(path) {
    gzFile f = gzopen(path.c_str(), "rb");
    if (!f) {
        throw DumpOpenError("Cannot open gzip archive " + path);
    }
    gzbuffer(f, 1 << 17);
    file_ = f;
}

GzipFileSource::~GzipFileSource() {
    if (file_) {
        gzclose(static_cast<gzFile>(file_));
    }
}

size_t GzipFileSource::read(char* buffer, size_t capacity) {
    gzFile f = static_cast<gzFile>(file_);
    int got = gzread(f, buffer, static_cast<unsigned int>(capacity));
    if (got < 0) {
        int errnum = 0;
        const char* msg = gzerror(f, &errnum);
        throw DumpReadError("gzip error in " + path_ + ": " + (msg ? msg : "unknown"));
    }
    return static_cast<size_t>(got);
}

// ============================================================================
// Bzip2FileSource
// ============================================================================

Bzip2FileSource::Bzip2FileSource(const std::string& path)
    : file_(open_file_or_throw(path)), path_(path) {
    try {
        open_stream({});
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
}

Bzip2FileSource::~Bzip2FileSource() {
    close_stream();
    if (file_) {
        std::fclose(file_);
    }
}

void Bzip2FileSource::open_stream(const std::vector<char>& unused) {
    int bzerror = BZ_OK;
    BZFILE* bz = BZ2_bzReadOpen(
        &bzerror, file_, 0, 0,
        unused.empty() ? nullptr : const_cast<char*>(unused.data()),
        static_cast<int>(unused.size())
    );
    if (bzerror != BZ_OK || !bz) {
        if (bz) {
            BZ2_bzReadClose(&bzerror, bz);
        }
        throw DumpOpenError("Cannot open bzip2 stream in " + path_);
    }
    stream_ = bz;
}

void Bzip2FileSource::close_stream() {
    if (stream_) {
        int bzerror = BZ_OK;
        BZ2_bzReadClose(&bzerror, static_cast<BZFILE*>(stream_));
        stream_ = nullptr;
    }
}

size_t Bzip2FileSource::read(char* buffer, size_t capacity) {
    while (!eof_) {
        int bzerror = BZ_OK;
        int n = BZ2_bzRead(&bzerror, static_cast<BZFILE*>(stream_), buffer, static_cast<int>(capacity));

        if (bzerror == BZ_OK) {
            if (n > 0) return static_cast<size_t>(n);
            continue;
        }

        if (bzerror == BZ_STREAM_END) {
            // A multi-stream archive continues with another bzip2 stream after this one.
            void* unused_ptr = nullptr;
            int unused_len = 0;
            BZ2_bzReadGetUnused(&bzerror, static_cast<BZFILE*>(stream_), &unused_ptr, &unused_len);
            std::vector<char> unused;
            if (bzerror == BZ_OK && unused_len > 0) {
                const char* begin = static_cast<const char*>(unused_ptr);
                unused.assign(begin, begin + unused_len);
            }
            close_stream();

            if (unused.empty()) {
                int c = std::fgetc(file_);
                if (c == EOF) {
                    eof_ = true;
                } else {
                    std::ungetc(c, file_);
                }
            }
            if (!eof_) {
                open_stream(unused);
            }
            if (n > 0) return static_cast<size_t>(n);
            continue;
        }

        throw DumpReadError("bzip2 error " + std::to_string(bzerror) + " in " + path_);
    }
    return 0;
}

std::unique_ptr<ByteSource> open_byte_source(const std::string& path) {
    if (ends_with(path, ".bz2")) {
        return std::make_unique<Bzip2FileSource>(path);
    }
    if (ends_with(path, ".gz")) {
        return std::make_unique<GzipFileSource>(path);
    }
    return std::make_unique<PlainFileSource>(path);
}

// ============================================================================
// LineCountEstimator
// ============================================================================

LineCountEstimator::LineCountEstimator(uint64_t archive_bytes, double initial_average_size)
    : archive_bytes_(archive_bytes),
      initial_average_size_(initial_average_size > 0.0 ? initial_average_size : 800.0) {}

void LineCountEstimator::observe(size_t line_size) {
    total_bytes_ += line_size;
    lines_++;
}

double LineCountEstimator::average_line_size() const {
    if (lines_ == 0) {
        return initial_average_size_;
    }
    return static_cast<double>(total_bytes_) / static_cast<double>(lines_);
}

uint64_t LineCountEstimator::estimated_total() const {
    double average = average_line_size();
    if (average <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(std::llround(static_cast<double>(archive_bytes_) / average));
}

// ============================================================================
// DumpReader
// ============================================================================

DumpReader::DumpReader(const std::string& path, double initial_average_size)
    : estimator_(0, initial_average_size) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw DumpOpenError("Cannot open archive " + path + ": " + ec.message());
    }
    archive_bytes_ = static_cast<uint64_t>(size);
    estimator_ = LineCountEstimator(archive_bytes_, initial_average_size);
    source_ = open_byte_source(path);
    buffer_.resize(BUFFER_SIZE);
}

DumpReader::DumpReader(std::unique_ptr<ByteSource> source, uint64_t archive_bytes,
                       double initial_average_size)
    : source_(std::move(source)),
      archive_bytes_(archive_bytes),
      estimator_(archive_bytes, initial_average_size) {
    if (!source_) {
        throw DumpOpenError("DumpReader requires a byte source");
    }
    buffer_.resize(BUFFER_SIZE);
}

bool DumpReader::fill_buffer() {
    if (exhausted_) return false;
    buffer_len_ = source_->read(buffer_.data(), buffer_.size());
    buffer_pos_ = 0;
    if (buffer_len_ == 0) {
        exhausted_ = true;
        return false;
    }
    return true;
}

bool DumpReader::next_line(std::string& line) {
    line.clear();
    bool got_any = false;

    while (true) {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer()) {
            break;
        }
        got_any = true;

        const char* start = buffer_.data() + buffer_pos_;
        size_t available = buffer_len_ - buffer_pos_;
        const void* newline = std::memchr(start, '\n', available);

        if (newline) {
            size_t len = static_cast<const char*>(newline) - start;
            line.append(start, len);
            buffer_pos_ += len + 1;
            estimator_.observe(line.size() + 1);
            return true;
        }

        line.append(start, available);
        buffer_pos_ = buffer_len_;
    }

    // Final line without a trailing newline
    if (got_any && !line.empty()) {
        estimator_.observe(line.size());
        return true;
    }
    return false;
}

} // namespace wdi
