#include "unicsv/scalar_encoder.h"
#include "unicsv/error.h"
#include "unicsv/log.h"
#include "unicsv/utf8.h"

#include <string>
#include <utility>
#include <vector>

namespace unicsv {

ScalarEncoder::ScalarEncoder(std::unique_ptr<ByteSink> sink, TextEncoding encoding)
    : sink_(std::move(sink)), encoding_(encoding) {
    if (!is_supported(encoding_)) {
        throw CsvException(ErrorCode::UNSUPPORTED_ENCODING,
                           std::string("No encoder for encoding ") + encoding_to_string(encoding_),
                           "Use ASCII, UTF-8, UTF-16 or UTF-32.");
    }
}

void ScalarEncoder::write_bom(BomStrategy strategy) {
    std::vector<uint8_t> bom = bom_bytes(strategy, encoding_);
    if (!bom.empty()) write_bytes(bom.data(), bom.size());
}

void ScalarEncoder::write_bytes(const uint8_t* data, size_t len) {
    int empty_writes = 0;
    while (len > 0) {
        std::ptrdiff_t n = sink_->write(data, len);
        if (n < 0) {
            throw CsvException(ErrorCode::STREAM_WRITE_FAILURE, "Output stream failed");
        }
        if (n == 0) {
            if (++empty_writes >= WRITE_ATTEMPTS) {
                throw CsvException(ErrorCode::STREAM_EMPTY_WRITE,
                                   "Output stream accepted no bytes after " +
                                       std::to_string(WRITE_ATTEMPTS) + " attempts");
            }
            logger()->warn("zero-byte write, retrying ({} of {})", empty_writes + 1, WRITE_ATTEMPTS);
            continue;
        }
        data += n;
        len -= static_cast<size_t>(n);
        empty_writes = 0;
    }
}

void ScalarEncoder::check_encodable(char32_t scalar) const {
    const uint32_t cp = static_cast<uint32_t>(scalar);

    switch (encoding_) {
        case TextEncoding::ASCII:
            if (cp >= 0x80) {
                throw CsvException(ErrorCode::INVALID_ASCII,
                                   "Scalar U+" + std::to_string(cp) + " is not ASCII");
            }
            return;

        case TextEncoding::UTF8:
            if (!is_unicode_scalar(cp)) {
                throw CsvException(ErrorCode::INVALID_UTF8, "Scalar can't be encoded as UTF-8");
            }
            return;

        case TextEncoding::UTF16:
        case TextEncoding::UTF16_BE:
        case TextEncoding::UTF16_LE:
            if (!is_unicode_scalar(cp)) {
                throw CsvException(ErrorCode::INVALID_UTF16, "Scalar can't be encoded as UTF-16");
            }
            return;

        case TextEncoding::UTF32:
        case TextEncoding::UTF32_BE:
        case TextEncoding::UTF32_LE:
            if (!is_unicode_scalar(cp)) {
                throw CsvException(ErrorCode::INVALID_UTF32, "Scalar can't be encoded as UTF-32");
            }
            return;

        default:
            throw CsvException(ErrorCode::UNSUPPORTED_ENCODING,
                               std::string("No encoder for encoding ") + encoding_to_string(encoding_));
    }
}

void ScalarEncoder::encode(char32_t scalar) {
    check_encodable(scalar);

    uint8_t bytes[4];
    size_t len = 0;
    const uint32_t cp = static_cast<uint32_t>(scalar);

    switch (encoding_) {
        case TextEncoding::ASCII:
            bytes[0] = static_cast<uint8_t>(cp);
            len = 1;
            break;

        case TextEncoding::UTF8:
            len = utf8_encode(scalar, bytes);
            break;

        case TextEncoding::UTF16:
        case TextEncoding::UTF16_BE:
        case TextEncoding::UTF16_LE: {
            const bool le = encoding_ == TextEncoding::UTF16_LE;
            auto put = [&](uint16_t unit) {
                bytes[len++] = static_cast<uint8_t>(le ? unit & 0xFF : unit >> 8);
                bytes[len++] = static_cast<uint8_t>(le ? unit >> 8 : unit & 0xFF);
            };
            if (cp < 0x10000) {
                put(static_cast<uint16_t>(cp));
            } else {
                uint32_t v = cp - 0x10000;
                put(static_cast<uint16_t>(0xD800 + (v >> 10)));
                put(static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
            }
            break;
        }

        default:
            if (encoding_ == TextEncoding::UTF32_LE) {
                bytes[0] = static_cast<uint8_t>(cp);
                bytes[1] = static_cast<uint8_t>(cp >> 8);
                bytes[2] = static_cast<uint8_t>(cp >> 16);
                bytes[3] = static_cast<uint8_t>(cp >> 24);
            } else {
                bytes[0] = static_cast<uint8_t>(cp >> 24);
                bytes[1] = static_cast<uint8_t>(cp >> 16);
                bytes[2] = static_cast<uint8_t>(cp >> 8);
                bytes[3] = static_cast<uint8_t>(cp);
            }
            len = 4;
            break;
    }

    write_bytes(bytes, len);
}

void ScalarEncoder::flush() {
    if (!sink_->flush()) {
        throw CsvException(ErrorCode::STREAM_WRITE_FAILURE, "Could not flush output stream");
    }
}

}  // namespace unicsv
