/**
 * Test helpers for unicsv unit tests.
 *
 * Provides RAII temporary files, failing byte sources and sinks, and small
 * conversions between strings and byte vectors.
 */

#ifndef UNICSV_TEST_HELPERS_H
#define UNICSV_TEST_HELPERS_H

#include "unicsv/io.h"
#include "unicsv/reader.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * RAII wrapper for a file in the system temp directory.
 *
 * The file is removed when the guard goes out of scope, even when a test
 * fails with an exception or an early return.
 *
 * Usage:
 *   TempFile file("reader_test.csv");
 *   file.write("a,b\n1,2\n");
 *   auto reader = Reader::from_file(file.path);
 */
struct TempFile {
    std::string path;

    explicit TempFile(const std::string& name)
        : path((std::filesystem::temp_directory_path() / ("unicsv_" + name)).string()) {
        std::remove(path.c_str());
    }

    ~TempFile() { std::remove(path.c_str()); }

    void write(std::string_view content) const {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::string read() const {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Non-copyable, non-movable
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&&) = delete;
    TempFile& operator=(TempFile&&) = delete;
};

inline std::vector<uint8_t> to_bytes(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::vector<uint8_t> bytes_of(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

inline std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

inline std::vector<unicsv::Row> read_all_rows(unicsv::Reader& reader) {
    std::vector<unicsv::Row> rows;
    while (auto row = reader.read_row()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

/// Delivers its bytes in small pieces, then reports a read failure.
class FailingSource : public unicsv::ByteSource {
public:
    explicit FailingSource(std::string_view data, size_t piece = 4)
        : data_(data), piece_(piece) {}

    std::ptrdiff_t read(uint8_t* buf, size_t capacity) override {
        if (pos_ >= data_.size()) return -1;
        size_t n = std::min({capacity, piece_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, n, buf);
        pos_ += n;
        return static_cast<std::ptrdiff_t>(n);
    }

private:
    std::string data_;
    size_t piece_;
    size_t pos_ = 0;
};

/// Accepts zero bytes for the first zero_writes calls, then everything.
class StallingSink : public unicsv::ByteSink {
public:
    explicit StallingSink(int zero_writes) : zero_writes_(zero_writes) {}

    std::ptrdiff_t write(const uint8_t* buf, size_t len) override {
        ++calls_;
        if (zero_writes_ > 0) {
            --zero_writes_;
            return 0;
        }
        data_.insert(data_.end(), buf, buf + len);
        return static_cast<std::ptrdiff_t>(len);
    }

    const std::vector<uint8_t>& data() const { return data_; }
    int calls() const { return calls_; }

private:
    int zero_writes_;
    int calls_ = 0;
    std::vector<uint8_t> data_;
};

/// Fails every write and flush.
class BrokenSink : public unicsv::ByteSink {
public:
    std::ptrdiff_t write(const uint8_t*, size_t) override { return -1; }
    bool flush() override { return false; }
};

#endif  // UNICSV_TEST_HELPERS_H
