/**
 * @file scalar_encoder.h
 * @brief Encoding of Unicode scalars into bytes written to a ByteSink.
 */

#ifndef UNICSV_SCALAR_ENCODER_H
#define UNICSV_SCALAR_ENCODER_H

#include "unicsv/encoding.h"
#include "unicsv/io.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace unicsv {

/**
 * @brief Writes scalars to a sink in a fixed text encoding.
 *
 * Each scalar is written with one bounded retry loop: a sink that accepts
 * zero bytes WRITE_ATTEMPTS times in a row fails with STREAM_EMPTY_WRITE,
 * and a sink reporting an error fails with STREAM_WRITE_FAILURE.
 */
class ScalarEncoder {
public:
    static constexpr int WRITE_ATTEMPTS = 2;

    /// @throws CsvException UNSUPPORTED_ENCODING if encoding has no encoder.
    ScalarEncoder(std::unique_ptr<ByteSink> sink, TextEncoding encoding);

    ScalarEncoder(ScalarEncoder&&) = default;
    ScalarEncoder& operator=(ScalarEncoder&&) = default;

    /// Emits the BOM selected by strategy for this encoding, if any.
    void write_bom(BomStrategy strategy);

    /// @throws CsvException INVALID_ASCII/UTF8/UTF16/UTF32 if the scalar
    ///         can't be represented in this encoding. Writes nothing.
    void check_encodable(char32_t scalar) const;

    /// @throws CsvException as check_encodable(), or a stream error from the sink.
    void encode(char32_t scalar);

    void encode(std::u32string_view scalars) {
        for (char32_t c : scalars) encode(c);
    }

    /// Writes raw bytes with the retry policy.
    void write_bytes(const uint8_t* data, size_t len);

    /// @throws CsvException STREAM_WRITE_FAILURE if the sink fails to flush.
    void flush();

    TextEncoding encoding() const { return encoding_; }
    ByteSink& sink() { return *sink_; }
    const ByteSink& sink() const { return *sink_; }

private:
    std::unique_ptr<ByteSink> sink_;
    TextEncoding encoding_;
};

}  // namespace unicsv

#endif  // UNICSV_SCALAR_ENCODER_H
