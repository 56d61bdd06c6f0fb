#include <gtest/gtest.h>
#include "dump/dump_reader.hpp"
#include <algorithm>
#include <bzlib.h>
#include <zlib.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace wdi;
namespace fs = std::filesystem;

namespace {

// Serves a string in fixed-size chunks so lines straddle reads
class ChunkedSource : public ByteSource {
public:
    ChunkedSource(std::string data, size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

    size_t read(char* buffer, size_t capacity) override {
        size_t n = std::min({chunk_, capacity, data_.size() - pos_});
        std::copy(data_.data() + pos_, data_.data() + pos_ + n, buffer);
        pos_ += n;
        return n;
    }

    std::string get_format() const override { return "memory"; }

private:
    std::string data_;
    size_t chunk_;
    size_t pos_ = 0;
};

std::vector<std::string> read_all(DumpReader& reader) {
    std::vector<std::string> lines;
    std::string line;
    while (reader.next_line(line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

class DumpReaderTest : public ::testing::Test {
protected:
    fs::path dir;
    std::string content = "[\n{\"id\":\"Q1\"},\n{\"id\":\"Q2\"},\n{\"id\":\"Q3\"}\n]\n";

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("wdi_dump_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_plain(const std::string& name) {
        std::string path = (dir / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::string write_gzip(const std::string& name) {
        std::string path = (dir / name).string();
        gzFile gz = gzopen(path.c_str(), "wb");
        EXPECT_NE(gz, nullptr);
        gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
        gzclose(gz);
        return path;
    }

    std::string write_bzip2(const std::string& name, int streams = 1) {
        std::string path = (dir / name).string();
        FILE* f = std::fopen(path.c_str(), "wb");
        EXPECT_NE(f, nullptr);
        size_t half = content.size() / 2;
        for (int s = 0; s < streams; ++s) {
            std::string part = (streams == 1) ? content
                             : (s == 0 ? content.substr(0, half) : content.substr(half));
            int err = BZ_OK;
            BZFILE* bz = BZ2_bzWriteOpen(&err, f, 9, 0, 0);
            EXPECT_EQ(err, BZ_OK);
            BZ2_bzWrite(&err, bz, part.data(), static_cast<int>(part.size()));
            EXPECT_EQ(err, BZ_OK);
            BZ2_bzWriteClose(&err, bz, 0, nullptr, nullptr);
        }
        std::fclose(f);
        return path;
    }
};

// ==========================================
// Formats
// ==========================================

TEST_F(DumpReaderTest, ReadsPlainFile) {
    DumpReader reader(write_plain("dump.json"));
    auto lines = read_all(reader);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "[");
    EXPECT_EQ(lines[1], "{\"id\":\"Q1\"},");
    EXPECT_EQ(lines[3], "{\"id\":\"Q3\"}");
    EXPECT_EQ(lines[4], "]");
    EXPECT_EQ(reader.get_format(), "plain");
}

TEST_F(DumpReaderTest, ReadsGzipFile) {
    DumpReader reader(write_gzip("dump.json.gz"));
    auto lines = read_all(reader);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[2], "{\"id\":\"Q2\"},");
    EXPECT_EQ(reader.get_format(), "gzip");
}

TEST_F(DumpReaderTest, ReadsBzip2File) {
    DumpReader reader(write_bzip2("dump.json.bz2"));
    auto lines = read_all(reader);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[3], "{\"id\":\"Q3\"}");
    EXPECT_EQ(reader.get_format(), "bzip2");
}

TEST_F(DumpReaderTest, ReadsConcatenatedBzip2Streams) {
    DumpReader reader(write_bzip2("multi.json.bz2", 2));
    auto lines = read_all(reader);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[1], "{\"id\":\"Q1\"},");
    EXPECT_EQ(lines[4], "]");
}

TEST_F(DumpReaderTest, MissingArchiveIsFatal) {
    EXPECT_THROW(DumpReader((dir / "absent.json.bz2").string()), DumpOpenError);
}

TEST_F(DumpReaderTest, CorruptBzip2IsAnError) {
    std::string path = (dir / "corrupt.json.bz2").string();
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not bzip2 data at all";
    }
    DumpReader reader(path);
    std::string line;
    EXPECT_THROW(reader.next_line(line), DumpReadError);
}

// ==========================================
// Line Splitting
// ==========================================

TEST_F(DumpReaderTest, LinesSpanningReadsAreJoined) {
    std::string data = "first line\nsecond, somewhat longer line\nlast";
    DumpReader reader(std::make_unique<ChunkedSource>(data, 3), data.size());
    auto lines = read_all(reader);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first line");
    EXPECT_EQ(lines[1], "second, somewhat longer line");
    EXPECT_EQ(lines[2], "last");
}

TEST_F(DumpReaderTest, EmptySourceYieldsNothing) {
    DumpReader reader(std::make_unique<ChunkedSource>("", 16), 0);
    std::string line;
    EXPECT_FALSE(reader.next_line(line));
    EXPECT_EQ(reader.lines_read(), 0u);
}

// ==========================================
// Progress Estimate
// ==========================================

TEST(LineCountEstimatorTest, UsesInitialAverageBeforeFirstLine) {
    LineCountEstimator estimator(8000, 800.0);
    EXPECT_DOUBLE_EQ(estimator.average_line_size(), 800.0);
    EXPECT_EQ(estimator.estimated_total(), 10u);
}

TEST(LineCountEstimatorTest, RunningMeanUpdatesEstimate) {
    LineCountEstimator estimator(1000, 800.0);
    estimator.observe(100);
    estimator.observe(300);

    EXPECT_DOUBLE_EQ(estimator.average_line_size(), 200.0);
    EXPECT_EQ(estimator.estimated_total(), 5u);
    EXPECT_EQ(estimator.lines_observed(), 2u);
}

TEST_F(DumpReaderTest, ReaderRepublishesEstimatePerLine) {
    std::string data = "aaaa\nbbbbbbbb\n";   // 5 and 9 bytes with newlines
    DumpReader reader(std::make_unique<ChunkedSource>(data, 64), 700, 100.0);

    EXPECT_EQ(reader.estimated_total(), 7u);

    std::string line;
    ASSERT_TRUE(reader.next_line(line));
    EXPECT_DOUBLE_EQ(reader.average_line_size(), 5.0);
    EXPECT_EQ(reader.estimated_total(), 140u);

    ASSERT_TRUE(reader.next_line(line));
    EXPECT_DOUBLE_EQ(reader.average_line_size(), 7.0);
    EXPECT_EQ(reader.estimated_total(), 100u);
}
