/**
 * @file writer.h
 * @brief Row-by-row CSV writer producing encoded bytes.
 *
 * @example
 * @code
 * unicsv::WriterOptions options;
 * options.headers = {"seq", "name"};
 * auto writer = unicsv::Writer::to_file("out.csv", options);
 * writer.write_row({"1", "Ann"});
 * writer.write_row({"2", "Bea, C"});  // written as "Bea, C" in quotes
 * writer.end_file();
 * @endcode
 */

#ifndef UNICSV_WRITER_H
#define UNICSV_WRITER_H

#include "unicsv/encoding.h"
#include "unicsv/io.h"
#include "unicsv/record.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace unicsv {

/**
 * @brief Configuration for Writer.
 */
struct WriterOptions {
    std::u32string field_delimiter = U",";
    std::u32string row_delimiter = U"\n";

    /// Escaping scalar, or std::nullopt to reject fields containing delimiters.
    std::optional<char32_t> escaping = U'"';

    /// Written as the first row when not empty.
    std::vector<std::string> headers;

    /// Output encoding; std::nullopt means UTF-8.
    std::optional<TextEncoding> encoding;

    BomStrategy bom_strategy = BomStrategy::CONVENTION;

    /// Escape every non-empty field, not only those that need it.
    bool escape_all_fields = false;
};

/// File-level writer state.
enum class WriterState {
    UNBEGUN,  ///< Nothing written yet, BOM pending
    ACTIVE,   ///< Accepting fields and rows
    CLOSED    ///< end_file() was called
};

/**
 * @brief Sequential CSV writer.
 *
 * Every row has the width of the first row written (or of the headers).
 * Short rows are padded with empty fields; writing past the width fails
 * with FIELD_OVERFLOW. Not thread-safe.
 */
class Writer {
public:
    /**
     * @param sink Output, owned by the writer
     * @param options Writer configuration
     * @param emit_bom Whether a BOM may be written at all (false when appending)
     *
     * @throws CsvException EMPTY_DELIMITER, SAME_DELIMITERS or
     *         UNSUPPORTED_ENCODING for bad options.
     */
    explicit Writer(std::unique_ptr<ByteSink> sink,
                    const WriterOptions& options = WriterOptions(),
                    bool emit_bom = true);

    /// Ends the file if end_file() wasn't called. Errors are logged.
    ~Writer();

    Writer(Writer&&) noexcept;
    Writer& operator=(Writer&&) noexcept;
    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    static Writer to_memory(const WriterOptions& options = WriterOptions());
    static Writer to_stream(std::ostream& output, const WriterOptions& options = WriterOptions());
    static Writer to_file(const std::string& path, const WriterOptions& options = WriterOptions(),
                          bool append = false);

    /// Encode whole tables in one call.
    static std::string encode(const std::vector<Row>& rows, const WriterOptions& options = WriterOptions());
    static std::vector<uint8_t> encode_bytes(const std::vector<Row>& rows,
                                             const WriterOptions& options = WriterOptions());

    /// Append one field to the current row, escaping it if needed.
    void write_field(std::string_view field);

    /// Append several fields; nothing is written if they don't all fit.
    void write_fields(const std::vector<std::string>& fields);

    /// write_fields() followed by end_row().
    void write_row(const std::vector<std::string>& fields);

    /// Pad the current row to the expected width and write the row delimiter.
    void end_row();

    /// Write a row of empty fields.
    /// @throws CsvException ROW_COMPLETION_ON_EMPTY_FILE while the width is unknown.
    void write_empty_row();

    /// Finish the current row, flush and close. Idempotent.
    void end_file();

    /// Bytes written so far, for writers created with to_memory().
    /// @throws std::logic_error for other sinks.
    const std::vector<uint8_t>& data() const;

    WriterState state() const;
    size_t row_index() const;
    size_t field_index() const;
    size_t expected_fields() const;
    TextEncoding encoding() const;
    const WriterOptions& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace unicsv

#endif  // UNICSV_WRITER_H
