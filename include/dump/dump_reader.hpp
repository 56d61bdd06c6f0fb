#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace wdi {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief The archive could not be opened. Fatal for the run.
 */
class DumpOpenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The decompressor reported corrupt or truncated data.
 */
class DumpReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Byte Sources
// ============================================================================

/**
 * @brief Decompressed byte stream over an archive file
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to `capacity` decompressed bytes into `buffer`
     *
     * @return Number of bytes read, 0 at end of stream
     * @throws DumpReadError on corrupt input
     */
    virtual size_t read(char* buffer, size_t capacity) = 0;

    /**
     * @brief Name of the compression format ("plain", "gzip", "bzip2")
     */
    virtual std::string get_format() const = 0;
};

/**
 * @brief Uncompressed file
 */
class PlainFileSource : public ByteSource {
public:
    explicit PlainFileSource(const std::string& path);
    ~PlainFileSource() override;

    PlainFileSource(const PlainFileSource&) = delete;
    PlainFileSource& operator=(const PlainFileSource&) = delete;

    size_t read(char* buffer, size_t capacity) override;
    std::string get_format() const override { return "plain"; }

private:
    std::FILE* file_ = nullptr;
    std::string path_;
};

/**
 * @brief gzip archive (multi-member archives are read through)
 */
class GzipFileSource : public ByteSource {
public:
    explicit GzipFileSource(const std::string& path);
    ~GzipFileSource() override;

    GzipFileSource(const GzipFileSource&) = delete;
    GzipFileSource& operator=(const GzipFileSource&) = delete;

    size_t read(char* buffer, size_t capacity) override;
    std::string get_format() const override { return "gzip"; }

private:
    void* file_ = nullptr;  // gzFile
    std::string path_;
};

/**
 * @brief bzip2 archive, including multi-stream archives written by parallel compressors
 */
class Bzip2FileSource : public ByteSource {
public:
    explicit Bzip2FileSource(const std::string& path);
    ~Bzip2FileSource() override;

    Bzip2FileSource(const Bzip2FileSource&) = delete;
    Bzip2FileSource& operator=(const Bzip2FileSource&) = delete;

    size_t read(char* buffer, size_t capacity) override;
    std::string get_format() const override { return "bzip2"; }

private:
    void open_stream(const std::vector<char>& unused);
    void close_stream();

    std::FILE* file_ = nullptr;
    void* stream_ = nullptr;  // BZFILE*
    bool eof_ = false;
    std::string path_;
};

/**
 * @brief Open a byte source chosen by file extension (.gz, .bz2, anything else is plain)
 *
 * @throws DumpOpenError if the file cannot be opened
 */
std::unique_ptr<ByteSource> open_byte_source(const std::string& path);

// ============================================================================
// Progress Estimation
// ============================================================================

/**
 * @brief Running estimate of the number of lines in an archive
 *
 * The estimate is archive_bytes / mean_line_size, where the mean starts at an
 * assumed size and is replaced by the observed running mean once lines arrive.
 * It is only used for progress display.
 */
class LineCountEstimator {
public:
    LineCountEstimator(uint64_t archive_bytes, double initial_average_size);

    void observe(size_t line_size);

    double average_line_size() const;
    uint64_t estimated_total() const;
    uint64_t lines_observed() const { return lines_; }

private:
    uint64_t archive_bytes_ = 0;
    double initial_average_size_ = 800.0;
    uint64_t total_bytes_ = 0;
    uint64_t lines_ = 0;
};

// ============================================================================
// Dump Reader
// ============================================================================

/**
 * @brief Lazy, single-pass line reader over a compressed entity dump
 *
 * Yields raw lines without the trailing newline. Line content is not validated.
 * Every line updates the running line-count estimate.
 */
class DumpReader {
public:
    /**
     * @brief Open the archive at `path`
     *
     * @param path Archive path (.bz2, .gz or uncompressed)
     * @param initial_average_size Assumed bytes per line before any line is read
     * @throws DumpOpenError if the archive cannot be opened
     */
    explicit DumpReader(const std::string& path, double initial_average_size = 800.0);

    /**
     * @brief Construct over an already opened source (used by tests)
     */
    DumpReader(std::unique_ptr<ByteSource> source, uint64_t archive_bytes,
               double initial_average_size = 800.0);

    /**
     * @brief Fetch the next line
     *
     * @param line Receives the line without its trailing '\n'
     * @return false once the stream is exhausted
     */
    bool next_line(std::string& line);

    uint64_t lines_read() const { return estimator_.lines_observed(); }
    uint64_t archive_bytes() const { return archive_bytes_; }
    uint64_t estimated_total() const { return estimator_.estimated_total(); }
    double average_line_size() const { return estimator_.average_line_size(); }
    std::string get_format() const { return source_->get_format(); }

private:
    bool fill_buffer();

    std::unique_ptr<ByteSource> source_;
    uint64_t archive_bytes_ = 0;
    LineCountEstimator estimator_;

    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
    bool exhausted_ = false;

    static constexpr size_t BUFFER_SIZE = 1 << 20;
};

} // namespace wdi
