/**
 * @file scalar_decoder.h
 * @brief Pull-based decoding of encoded bytes into Unicode scalars.
 */

#ifndef UNICSV_SCALAR_DECODER_H
#define UNICSV_SCALAR_DECODER_H

#include "unicsv/encoding.h"
#include "unicsv/io.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace unicsv {

/**
 * @brief Decodes one Unicode scalar per call from a ByteSource.
 *
 * The encoding is fixed at construction and dispatched with a switch on
 * every call. Bytes are pulled from the source in CHUNK_SIZE blocks.
 *
 * @example
 * @code
 * auto decoder = unicsv::ScalarDecoder::open(
 *     std::make_unique<unicsv::MemorySource>("a,b\n"), std::nullopt);
 * while (auto c = decoder.next()) {
 *     // ...
 * }
 * @endcode
 */
class ScalarDecoder {
public:
    static constexpr size_t CHUNK_SIZE = 1024;

    /**
     * @brief Decode a source with a known encoding.
     *
     * @param source Byte source, owned by the decoder
     * @param encoding Encoding to decode
     * @param replay Bytes already taken from source that must be decoded first
     *
     * @throws CsvException UNSUPPORTED_ENCODING if encoding has no decoder.
     */
    ScalarDecoder(std::unique_ptr<ByteSource> source, TextEncoding encoding,
                  std::vector<uint8_t> replay = {});

    /**
     * @brief Sniff the BOM of source and decode with the resolved encoding.
     *
     * Reads up to MAX_BOM_LENGTH bytes, skips a recognized BOM and replays
     * the remaining bytes.
     *
     * @throws CsvException MISMATCHED_ENCODING if declared and BOM disagree.
     * @throws CsvException UNSUPPORTED_ENCODING if declared has no decoder.
     * @throws CsvException STREAM_READ_FAILURE if the source fails.
     */
    static ScalarDecoder open(std::unique_ptr<ByteSource> source,
                              std::optional<TextEncoding> declared);

    ScalarDecoder(ScalarDecoder&&) = default;
    ScalarDecoder& operator=(ScalarDecoder&&) = default;

    /// Next scalar, or std::nullopt at end of input.
    /// @throws CsvException on malformed input or a failed source.
    std::optional<char32_t> next();

    TextEncoding encoding() const { return encoding_; }

private:
    std::unique_ptr<ByteSource> source_;
    TextEncoding encoding_;
    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;
    bool eof_ = false;
    bool failed_ = false;

    bool next_byte(uint8_t& out);
    size_t read_unit(uint8_t* out, size_t width);

    std::optional<char32_t> decode_ascii();
    std::optional<char32_t> decode_utf8();
    std::optional<char32_t> decode_utf16(bool little_endian);
    std::optional<char32_t> decode_utf32(bool little_endian);
};

}  // namespace unicsv

#endif  // UNICSV_SCALAR_DECODER_H
