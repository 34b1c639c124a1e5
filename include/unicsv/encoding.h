/**
 * @file encoding.h
 * @brief Text encodings, byte order marks and encoding resolution.
 *
 * The reader sniffs a byte order mark at the start of its input and combines
 * it with the encoding declared in ReaderOptions via select_encoding(). The
 * writer emits a BOM according to a BomStrategy.
 */

#ifndef UNICSV_ENCODING_H
#define UNICSV_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace unicsv {

/**
 * @brief Text encodings known to the library.
 *
 * UTF16 and UTF32 are the endianness-agnostic forms: when read they follow
 * the BOM if present and default to big-endian otherwise. LATIN1 and
 * WINDOWS_1252 are recognized but unsupported, so that asking for them fails
 * fast with UNSUPPORTED_ENCODING.
 */
enum class TextEncoding {
    ASCII,
    UTF8,
    UTF16,
    UTF16_LE,
    UTF16_BE,
    UTF32,
    UTF32_LE,
    UTF32_BE,
    LATIN1,
    WINDOWS_1252
};

/// When the writer emits a byte order mark.
enum class BomStrategy {
    CONVENTION,  ///< Only for generic UTF16/UTF32 (big-endian BOM)
    ALWAYS,      ///< Whenever the encoding has a BOM
    NEVER        ///< Never
};

/// Longest BOM in bytes (UTF-32).
constexpr size_t MAX_BOM_LENGTH = 4;

/// Result of matching the first bytes of an input against the BOM table.
struct BomMatch {
    std::optional<TextEncoding> encoding;  ///< Encoding named by the BOM, if any
    size_t bom_length = 0;                 ///< Number of BOM bytes to skip
};

/// Human-readable encoding name, e.g. "UTF-16LE".
const char* encoding_to_string(TextEncoding enc);

/// Returns true if the encoding has a decoder and encoder.
bool is_supported(TextEncoding enc);

/// Returns true for UTF16 and UTF32 in any byte order.
bool is_multibyte_unit(TextEncoding enc);

/**
 * @brief Match the start of a buffer against the known BOMs.
 *
 * UTF-32 BOMs are tested before UTF-16 since FF FE 00 00 starts with the
 * UTF-16LE BOM. A BOM longer than len never matches.
 */
BomMatch detect_bom(const uint8_t* buf, size_t len);

/**
 * @brief Resolve the declared encoding against the one inferred from a BOM.
 *
 * - Neither present: UTF8.
 * - Only one present, or both equal: that one.
 * - Generic UTF16 with UTF16_LE/BE (or UTF32 with UTF32_LE/BE): the inferred,
 *   endianness-specific one.
 *
 * @throws CsvException MISMATCHED_ENCODING for any other combination.
 */
TextEncoding select_encoding(std::optional<TextEncoding> declared,
                             std::optional<TextEncoding> inferred);

/// BOM bytes the writer emits for a strategy and encoding (possibly none).
std::vector<uint8_t> bom_bytes(BomStrategy strategy, TextEncoding enc);

}  // namespace unicsv

#endif  // UNICSV_ENCODING_H
