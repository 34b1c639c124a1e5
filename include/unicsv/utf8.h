/**
 * @file utf8.h
 * @brief UTF-8 conversions between field strings and Unicode scalars.
 *
 * Fields cross the public API as UTF-8 std::string while the reader and
 * writer operate on char32_t scalars. These helpers convert between the two
 * and reject malformed input instead of substituting U+FFFD.
 */

#ifndef UNICSV_UTF8_H
#define UNICSV_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace unicsv {

/// Returns true if the value is a Unicode scalar (not a surrogate, <= U+10FFFF).
inline bool is_unicode_scalar(uint32_t value) {
    return value <= 0x10FFFF && (value < 0xD800 || value > 0xDFFF);
}

/**
 * @brief Decode one UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] scalar The decoded scalar, untouched on failure
 * @return The number of bytes consumed (1-4), or 0 for a malformed,
 *         overlong, surrogate or truncated sequence
 */
size_t utf8_decode(std::string_view str, size_t pos, char32_t& scalar);

/**
 * @brief Encode a scalar as UTF-8.
 *
 * @param scalar The scalar to encode
 * @param[out] out Receives 1-4 bytes
 * @return The number of bytes written, or 0 if scalar is not encodable
 */
size_t utf8_encode(char32_t scalar, uint8_t out[4]);

/// Appends the UTF-8 form of scalar to out. Non-scalars are ignored.
void utf8_append(std::string& out, char32_t scalar);

/// Converts scalars to a UTF-8 string.
std::string to_utf8(std::u32string_view scalars);

/// Converts a UTF-8 string to scalars.
/// @throws CsvException with INVALID_UTF8 on malformed input.
std::u32string from_utf8(std::string_view str);

}  // namespace unicsv

#endif  // UNICSV_UTF8_H
