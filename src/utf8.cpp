/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 conversions.
 */

#include "unicsv/utf8.h"
#include "unicsv/error.h"

namespace unicsv {

size_t utf8_decode(std::string_view str, size_t pos, char32_t& scalar) {
    if (pos >= str.size()) {
        return 0;
    }

    uint8_t byte = static_cast<uint8_t>(str[pos]);

    // ASCII (0xxxxxxx)
    if ((byte & 0x80) == 0) {
        scalar = byte;
        return 1;
    }

    // Determine sequence length and initial bits
    size_t len;
    uint32_t cp;

    if ((byte & 0xE0) == 0xC0) {
        len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        len = 4;
        cp = byte & 0x07;
    } else {
        // Invalid leading byte or stray continuation byte
        return 0;
    }

    if (pos + len > str.size()) {
        return 0;
    }

    // Decode continuation bytes (10xxxxxx)
    for (size_t i = 1; i < len; ++i) {
        uint8_t cont = static_cast<uint8_t>(str[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    // Overlong encodings
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
        return 0;
    }

    if (!is_unicode_scalar(cp)) {
        return 0;
    }

    scalar = static_cast<char32_t>(cp);
    return len;
}

size_t utf8_encode(char32_t scalar, uint8_t out[4]) {
    uint32_t cp = static_cast<uint32_t>(scalar);
    if (!is_unicode_scalar(cp)) {
        return 0;
    }
    if (cp < 0x80) {
        out[0] = static_cast<uint8_t>(cp);
        return 1;
    }
    if (cp < 0x800) {
        out[0] = static_cast<uint8_t>(0xC0 | (cp >> 6));
        out[1] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        out[0] = static_cast<uint8_t>(0xE0 | (cp >> 12));
        out[1] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
        out[2] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 3;
    }
    out[0] = static_cast<uint8_t>(0xF0 | (cp >> 18));
    out[1] = static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F));
    out[2] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
    out[3] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
    return 4;
}

void utf8_append(std::string& out, char32_t scalar) {
    uint8_t bytes[4];
    size_t n = utf8_encode(scalar, bytes);
    out.append(reinterpret_cast<const char*>(bytes), n);
}

std::string to_utf8(std::u32string_view scalars) {
    std::string result;
    result.reserve(scalars.size());
    for (char32_t c : scalars) {
        utf8_append(result, c);
    }
    return result;
}

std::u32string from_utf8(std::string_view str) {
    std::u32string result;
    result.reserve(str.size());
    size_t pos = 0;
    while (pos < str.size()) {
        char32_t scalar = 0;
        size_t len = utf8_decode(str, pos, scalar);
        if (len == 0) {
            throw CsvException(ErrorCode::INVALID_UTF8,
                               "Malformed UTF-8 sequence at byte " + std::to_string(pos));
        }
        result.push_back(scalar);
        pos += len;
    }
    return result;
}

}  // namespace unicsv
