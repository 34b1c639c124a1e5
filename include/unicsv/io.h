/**
 * @file io.h
 * @brief Byte sources and sinks used by the reader and writer.
 *
 * Sources report failures through their return value rather than by
 * throwing, so the decoder can deliver the bytes already read before
 * surfacing the error. Constructors that open files throw CsvException
 * with STREAM_OPEN_FAILURE.
 */

#ifndef UNICSV_IO_H
#define UNICSV_IO_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unicsv {

/// Pull-based byte input.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to capacity bytes into buf.
    /// @return Bytes read, 0 at end of input, or -1 if the source failed.
    virtual std::ptrdiff_t read(uint8_t* buf, size_t capacity) = 0;
};

/// Source over an owned in-memory buffer.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemorySource(std::string_view text)
        : data_(reinterpret_cast<const uint8_t*>(text.data()),
                reinterpret_cast<const uint8_t*>(text.data()) + text.size()) {}

    std::ptrdiff_t read(uint8_t* buf, size_t capacity) override;

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

/// Source over a caller-owned input stream.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& input) : input_(input) {}

    std::ptrdiff_t read(uint8_t* buf, size_t capacity) override;

private:
    std::istream& input_;
};

/// Source over a file opened in binary mode.
class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);

    std::ptrdiff_t read(uint8_t* buf, size_t capacity) override;

private:
    std::ifstream file_;
};

/// Drains a source into memory.
/// @throws CsvException STREAM_READ_FAILURE if the source fails.
std::vector<uint8_t> read_all(ByteSource& source);

/// Push-based byte output.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Writes up to len bytes from buf.
    /// @return Bytes accepted (possibly 0), or -1 if the sink failed.
    virtual std::ptrdiff_t write(const uint8_t* buf, size_t len) = 0;

    /// Pushes buffered bytes to the underlying device.
    /// @return false if the sink failed.
    virtual bool flush() { return true; }
};

/// Sink collecting bytes in memory.
class MemorySink : public ByteSink {
public:
    std::ptrdiff_t write(const uint8_t* buf, size_t len) override;

    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::vector<uint8_t> data_;
};

/// Sink over a caller-owned output stream.
class StreamSink : public ByteSink {
public:
    explicit StreamSink(std::ostream& output) : output_(output) {}

    std::ptrdiff_t write(const uint8_t* buf, size_t len) override;
    bool flush() override;

private:
    std::ostream& output_;
};

/// Sink over a file opened in binary mode, truncating unless append is set.
class FileSink : public ByteSink {
public:
    FileSink(const std::string& path, bool append);

    std::ptrdiff_t write(const uint8_t* buf, size_t len) override;
    bool flush() override;

private:
    std::ofstream file_;
};

}  // namespace unicsv

#endif  // UNICSV_IO_H
