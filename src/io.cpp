#include "unicsv/io.h"
#include "unicsv/error.h"
#include <algorithm>
#include <cstring>

namespace unicsv {

std::ptrdiff_t MemorySource::read(uint8_t* buf, size_t capacity) {
    size_t n = std::min(capacity, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
    }
    return static_cast<std::ptrdiff_t>(n);
}

std::ptrdiff_t StreamSource::read(uint8_t* buf, size_t capacity) {
    if (input_.bad()) return -1;
    input_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(capacity));
    if (input_.bad()) return -1;
    return static_cast<std::ptrdiff_t>(input_.gcount());
}

FileSource::FileSource(const std::string& path)
    : file_(path, std::ios::in | std::ios::binary) {
    if (!file_.is_open()) {
        throw CsvException(ErrorCode::STREAM_OPEN_FAILURE, "Cannot open file: " + path);
    }
}

std::ptrdiff_t FileSource::read(uint8_t* buf, size_t capacity) {
    if (file_.bad()) return -1;
    file_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(capacity));
    if (file_.bad()) return -1;
    return static_cast<std::ptrdiff_t>(file_.gcount());
}

std::vector<uint8_t> read_all(ByteSource& source) {
    const size_t chunk_size = 64 * 1024;
    std::vector<uint8_t> data;
    uint8_t buffer[chunk_size];
    while (true) {
        std::ptrdiff_t n = source.read(buffer, chunk_size);
        if (n < 0) {
            throw CsvException(ErrorCode::STREAM_READ_FAILURE, "Could not read from source");
        }
        if (n == 0) break;
        data.insert(data.end(), buffer, buffer + n);
    }
    return data;
}

std::ptrdiff_t MemorySink::write(const uint8_t* buf, size_t len) {
    data_.insert(data_.end(), buf, buf + len);
    return static_cast<std::ptrdiff_t>(len);
}

std::ptrdiff_t StreamSink::write(const uint8_t* buf, size_t len) {
    output_.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(len));
    if (!output_) return -1;
    return static_cast<std::ptrdiff_t>(len);
}

bool StreamSink::flush() {
    output_.flush();
    return static_cast<bool>(output_);
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, std::ios::out | std::ios::binary | (append ? std::ios::app : std::ios::trunc)) {
    if (!file_.is_open()) {
        throw CsvException(ErrorCode::STREAM_OPEN_FAILURE, "Cannot open file: " + path);
    }
}

std::ptrdiff_t FileSink::write(const uint8_t* buf, size_t len) {
    file_.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(len));
    if (!file_) return -1;
    return static_cast<std::ptrdiff_t>(len);
}

bool FileSink::flush() {
    file_.flush();
    return static_cast<bool>(file_);
}

}  // namespace unicsv
