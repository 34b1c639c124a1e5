#include "unicsv/scalar_decoder.h"
#include "unicsv/error.h"
#include "unicsv/utf8.h"

#include <string>
#include <utility>

namespace unicsv {

ScalarDecoder::ScalarDecoder(std::unique_ptr<ByteSource> source, TextEncoding encoding,
                             std::vector<uint8_t> replay)
    : source_(std::move(source)), encoding_(encoding), buffer_(std::move(replay)) {
    if (!is_supported(encoding_)) {
        throw CsvException(ErrorCode::UNSUPPORTED_ENCODING,
                           std::string("No decoder for encoding ") + encoding_to_string(encoding_),
                           "Use ASCII, UTF-8, UTF-16 or UTF-32.");
    }
}

ScalarDecoder ScalarDecoder::open(std::unique_ptr<ByteSource> source,
                                  std::optional<TextEncoding> declared) {
    uint8_t prefix[MAX_BOM_LENGTH];
    size_t len = 0;
    while (len < MAX_BOM_LENGTH) {
        std::ptrdiff_t n = source->read(prefix + len, MAX_BOM_LENGTH - len);
        if (n < 0) {
            throw CsvException(ErrorCode::STREAM_READ_FAILURE,
                               "Could not read the byte order mark");
        }
        if (n == 0) break;
        len += static_cast<size_t>(n);
    }

    BomMatch bom = detect_bom(prefix, len);
    TextEncoding encoding = select_encoding(declared, bom.encoding);
    std::vector<uint8_t> replay(prefix + bom.bom_length, prefix + len);
    return ScalarDecoder(std::move(source), encoding, std::move(replay));
}

bool ScalarDecoder::next_byte(uint8_t& out) {
    if (pos_ < buffer_.size()) {
        out = buffer_[pos_++];
        return true;
    }
    if (failed_) {
        throw CsvException(ErrorCode::STREAM_READ_FAILURE, "Input stream failed");
    }
    if (eof_) return false;

    buffer_.resize(CHUNK_SIZE);
    pos_ = 0;
    std::ptrdiff_t n = source_->read(buffer_.data(), CHUNK_SIZE);
    if (n < 0) {
        buffer_.clear();
        failed_ = true;
        throw CsvException(ErrorCode::STREAM_READ_FAILURE, "Input stream failed");
    }
    buffer_.resize(static_cast<size_t>(n));
    if (n == 0) {
        eof_ = true;
        return false;
    }
    out = buffer_[pos_++];
    return true;
}

// Reads up to width bytes; returns how many were available.
size_t ScalarDecoder::read_unit(uint8_t* out, size_t width) {
    size_t i = 0;
    while (i < width && next_byte(out[i])) {
        ++i;
    }
    return i;
}

std::optional<char32_t> ScalarDecoder::next() {
    switch (encoding_) {
        case TextEncoding::ASCII:
            return decode_ascii();
        case TextEncoding::UTF8:
            return decode_utf8();
        case TextEncoding::UTF16:
        case TextEncoding::UTF16_BE:
            return decode_utf16(false);
        case TextEncoding::UTF16_LE:
            return decode_utf16(true);
        case TextEncoding::UTF32:
        case TextEncoding::UTF32_BE:
            return decode_utf32(false);
        case TextEncoding::UTF32_LE:
            return decode_utf32(true);
        default:
            break;
    }
    throw CsvException(ErrorCode::UNSUPPORTED_ENCODING,
                       std::string("No decoder for encoding ") + encoding_to_string(encoding_));
}

std::optional<char32_t> ScalarDecoder::decode_ascii() {
    uint8_t byte;
    if (!next_byte(byte)) return std::nullopt;
    if (byte >= 0x80) {
        throw CsvException(ErrorCode::INVALID_ASCII,
                           "Byte " + std::to_string(byte) + " is not 7-bit ASCII");
    }
    return static_cast<char32_t>(byte);
}

std::optional<char32_t> ScalarDecoder::decode_utf8() {
    uint8_t bytes[4];
    if (!next_byte(bytes[0])) return std::nullopt;
    if (bytes[0] < 0x80) return static_cast<char32_t>(bytes[0]);

    size_t len;
    if ((bytes[0] & 0xE0) == 0xC0) {
        len = 2;
    } else if ((bytes[0] & 0xF0) == 0xE0) {
        len = 3;
    } else if ((bytes[0] & 0xF8) == 0xF0) {
        len = 4;
    } else {
        throw CsvException(ErrorCode::INVALID_UTF8, "Invalid UTF-8 leading byte");
    }

    if (read_unit(bytes + 1, len - 1) != len - 1) {
        throw CsvException(ErrorCode::INVALID_UTF8, "Truncated UTF-8 sequence at end of input");
    }

    char32_t scalar = 0;
    std::string_view seq(reinterpret_cast<const char*>(bytes), len);
    if (utf8_decode(seq, 0, scalar) != len) {
        throw CsvException(ErrorCode::INVALID_UTF8, "Malformed UTF-8 sequence");
    }
    return scalar;
}

std::optional<char32_t> ScalarDecoder::decode_utf16(bool little_endian) {
    auto combine = [little_endian](const uint8_t* u) -> uint32_t {
        return little_endian ? (uint32_t(u[1]) << 8) | u[0] : (uint32_t(u[0]) << 8) | u[1];
    };

    uint8_t unit[2];
    size_t n = read_unit(unit, 2);
    if (n == 0) return std::nullopt;
    if (n == 1) {
        throw CsvException(ErrorCode::INCOMPLETE_UTF16, "Odd trailing byte in UTF-16 input");
    }

    uint32_t high = combine(unit);
    if (high < 0xD800 || high > 0xDFFF) {
        return static_cast<char32_t>(high);
    }
    if (high >= 0xDC00) {
        throw CsvException(ErrorCode::INVALID_UTF16, "Unpaired low surrogate in UTF-16 input");
    }

    n = read_unit(unit, 2);
    if (n == 1) {
        throw CsvException(ErrorCode::INCOMPLETE_UTF16, "Odd trailing byte in UTF-16 input");
    }
    uint32_t low = n == 2 ? combine(unit) : 0;
    if (low < 0xDC00 || low > 0xDFFF) {
        throw CsvException(ErrorCode::INVALID_UTF16, "Unpaired high surrogate in UTF-16 input");
    }
    return static_cast<char32_t>(0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00));
}

std::optional<char32_t> ScalarDecoder::decode_utf32(bool little_endian) {
    uint8_t unit[4];
    size_t n = read_unit(unit, 4);
    if (n == 0) return std::nullopt;
    if (n < 4) {
        throw CsvException(ErrorCode::INCOMPLETE_UTF32, "Truncated UTF-32 code unit at end of input");
    }

    uint32_t value;
    if (little_endian) {
        value = uint32_t(unit[0]) | (uint32_t(unit[1]) << 8) |
                (uint32_t(unit[2]) << 16) | (uint32_t(unit[3]) << 24);
    } else {
        value = (uint32_t(unit[0]) << 24) | (uint32_t(unit[1]) << 16) |
                (uint32_t(unit[2]) << 8) | uint32_t(unit[3]);
    }
    if (!is_unicode_scalar(value)) {
        throw CsvException(ErrorCode::INVALID_UTF32, "UTF-32 code unit is not a Unicode scalar");
    }
    return static_cast<char32_t>(value);
}

}  // namespace unicsv
