#include "unicsv/encoding.h"
#include "unicsv/error.h"
#include <cstring>
#include <iterator>
#include <string>

namespace unicsv {

const char* encoding_to_string(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::ASCII:        return "ASCII";
        case TextEncoding::UTF8:         return "UTF-8";
        case TextEncoding::UTF16:        return "UTF-16";
        case TextEncoding::UTF16_LE:     return "UTF-16LE";
        case TextEncoding::UTF16_BE:     return "UTF-16BE";
        case TextEncoding::UTF32:        return "UTF-32";
        case TextEncoding::UTF32_LE:     return "UTF-32LE";
        case TextEncoding::UTF32_BE:     return "UTF-32BE";
        case TextEncoding::LATIN1:       return "Latin-1";
        case TextEncoding::WINDOWS_1252: return "Windows-1252";
    }
    return "Unknown";
}

bool is_supported(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::LATIN1:
        case TextEncoding::WINDOWS_1252:
            return false;
        default:
            return true;
    }
}

bool is_multibyte_unit(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::UTF16:
        case TextEncoding::UTF16_LE:
        case TextEncoding::UTF16_BE:
        case TextEncoding::UTF32:
        case TextEncoding::UTF32_LE:
        case TextEncoding::UTF32_BE:
            return true;
        default:
            return false;
    }
}

// BOM (Byte Order Mark) patterns
static constexpr uint8_t UTF8_BOM[] = {0xEF, 0xBB, 0xBF};
static constexpr uint8_t UTF16_LE_BOM[] = {0xFF, 0xFE};
static constexpr uint8_t UTF16_BE_BOM[] = {0xFE, 0xFF};
static constexpr uint8_t UTF32_LE_BOM[] = {0xFF, 0xFE, 0x00, 0x00};
static constexpr uint8_t UTF32_BE_BOM[] = {0x00, 0x00, 0xFE, 0xFF};

// Check if buffer starts with a specific BOM
static bool has_bom(const uint8_t* buf, size_t len,
                    const uint8_t* bom, size_t bom_len) {
    if (len < bom_len) return false;
    return std::memcmp(buf, bom, bom_len) == 0;
}

BomMatch detect_bom(const uint8_t* buf, size_t len) {
    BomMatch result;

    // UTF-32 first: its LE BOM begins with the UTF-16 LE BOM
    if (has_bom(buf, len, UTF32_LE_BOM, 4)) {
        result.encoding = TextEncoding::UTF32_LE;
        result.bom_length = 4;
    } else if (has_bom(buf, len, UTF32_BE_BOM, 4)) {
        result.encoding = TextEncoding::UTF32_BE;
        result.bom_length = 4;
    } else if (has_bom(buf, len, UTF16_LE_BOM, 2)) {
        result.encoding = TextEncoding::UTF16_LE;
        result.bom_length = 2;
    } else if (has_bom(buf, len, UTF16_BE_BOM, 2)) {
        result.encoding = TextEncoding::UTF16_BE;
        result.bom_length = 2;
    } else if (has_bom(buf, len, UTF8_BOM, 3)) {
        result.encoding = TextEncoding::UTF8;
        result.bom_length = 3;
    }

    return result;
}

TextEncoding select_encoding(std::optional<TextEncoding> declared,
                             std::optional<TextEncoding> inferred) {
    if (!declared && !inferred) return TextEncoding::UTF8;
    if (!inferred) return *declared;
    if (!declared) return *inferred;
    if (*declared == *inferred) return *declared;

    switch (*declared) {
        case TextEncoding::UTF16:
            if (*inferred == TextEncoding::UTF16_LE || *inferred == TextEncoding::UTF16_BE) {
                return *inferred;
            }
            break;
        case TextEncoding::UTF32:
            if (*inferred == TextEncoding::UTF32_LE || *inferred == TextEncoding::UTF32_BE) {
                return *inferred;
            }
            break;
        default:
            break;
    }

    throw CsvException(ErrorCode::MISMATCHED_ENCODING,
                       std::string("Declared encoding ") + encoding_to_string(*declared) +
                           " does not match the byte order mark for " +
                           encoding_to_string(*inferred),
                       "Remove the declared encoding to let the byte order mark decide.");
}

std::vector<uint8_t> bom_bytes(BomStrategy strategy, TextEncoding enc) {
    if (strategy == BomStrategy::NEVER) return {};

    const bool always = strategy == BomStrategy::ALWAYS;
    switch (enc) {
        case TextEncoding::UTF8:
            if (always) return {std::begin(UTF8_BOM), std::end(UTF8_BOM)};
            break;
        case TextEncoding::UTF16_LE:
            if (always) return {std::begin(UTF16_LE_BOM), std::end(UTF16_LE_BOM)};
            break;
        case TextEncoding::UTF16_BE:
            if (always) return {std::begin(UTF16_BE_BOM), std::end(UTF16_BE_BOM)};
            break;
        case TextEncoding::UTF16:
            return {std::begin(UTF16_BE_BOM), std::end(UTF16_BE_BOM)};
        case TextEncoding::UTF32_LE:
            if (always) return {std::begin(UTF32_LE_BOM), std::end(UTF32_LE_BOM)};
            break;
        case TextEncoding::UTF32_BE:
            if (always) return {std::begin(UTF32_BE_BOM), std::end(UTF32_BE_BOM)};
            break;
        case TextEncoding::UTF32:
            return {std::begin(UTF32_BE_BOM), std::end(UTF32_BE_BOM)};
        default:
            break;
    }
    return {};
}

}  // namespace unicsv
