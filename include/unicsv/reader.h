/**
 * @file reader.h
 * @brief Row-by-row CSV reader operating on Unicode scalars.
 *
 * The reader pulls scalars from a ScalarDecoder, matches delimiters with
 * pushback through a ScalarBuffer and produces one row per call. It handles
 * escaped fields, trimming, headers, field-count validation and, when no
 * field delimiter is given, delimiter inference with DialectDetector.
 *
 * @example
 * @code
 * unicsv::ReaderOptions options;
 * options.header_strategy = unicsv::HeaderStrategy::FIRST_LINE;
 * auto reader = unicsv::Reader::from_file("data.csv", options);
 * for (const auto& row : reader) {
 *     std::cout << row[0] << "\n";
 * }
 * @endcode
 */

#ifndef UNICSV_READER_H
#define UNICSV_READER_H

#include "unicsv/encoding.h"
#include "unicsv/error.h"
#include "unicsv/io.h"
#include "unicsv/record.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unicsv {

/// How the header row is located.
enum class HeaderStrategy {
    NONE,         ///< Every row is data
    FIRST_LINE,   ///< The first row is the header
    LINE_NUMBER,  ///< Skip ReaderOptions::header_line rows, then read the header
    INFER         ///< Not available; rejected with UNSUPPORTED_INFERENCE
};

/// Reader lifecycle.
enum class ReaderStatus {
    ACTIVE,    ///< More rows may follow
    FINISHED,  ///< Clean end of input
    FAILED     ///< An error occurred; reads rethrow it
};

/**
 * @brief Configuration for Reader.
 */
struct ReaderOptions {
    /// Field delimiter. Empty asks for inference of a single-scalar delimiter.
    std::u32string field_delimiter = U",";

    /// Alternative row delimiters; any of them ends a row.
    std::vector<std::u32string> row_delimiters = {U"\n", U"\r\n"};

    /// Escaping scalar, or std::nullopt to disable escaped fields.
    std::optional<char32_t> escaping = U'"';

    HeaderStrategy header_strategy = HeaderStrategy::NONE;
    size_t header_line = 0;  ///< Rows skipped before the header (LINE_NUMBER)

    /// Scalars trimmed from both ends of every field.
    std::u32string trim_characters;

    /// Declared encoding; std::nullopt lets the BOM decide (UTF-8 without one).
    std::optional<TextEncoding> encoding;

    /// Read the whole input into memory before parsing.
    bool presample = false;

    /// Drop a single empty trailing field on rows that are one field too wide.
    bool ignore_extra_trailing_delimiter = false;

    /// Scalars sampled for delimiter inference.
    size_t inference_sample_size = 4096;
};

/**
 * @brief Sequential CSV reader.
 *
 * Not thread-safe. Once a read fails the reader stays FAILED and every later
 * read rethrows the same error.
 */
class Reader {
public:
    /**
     * @brief Open a reader over a byte source.
     *
     * Sniffs the BOM, validates options, infers the field delimiter if
     * needed and reads the header if the strategy asks for one.
     *
     * @throws CsvException INVALID_CONFIGURATION errors for bad options, an
     *         empty header or mismatched encodings; input and stream errors
     *         while reading the header.
     */
    explicit Reader(std::unique_ptr<ByteSource> source,
                    const ReaderOptions& options = ReaderOptions());
    ~Reader();

    Reader(Reader&&) noexcept;
    Reader& operator=(Reader&&) noexcept;
    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    static Reader from_string(std::string_view text, const ReaderOptions& options = ReaderOptions());
    static Reader from_bytes(std::vector<uint8_t> bytes, const ReaderOptions& options = ReaderOptions());
    static Reader from_file(const std::string& path, const ReaderOptions& options = ReaderOptions());
    static Reader from_stream(std::istream& input, const ReaderOptions& options = ReaderOptions());

    /// Read an entire input into a Document.
    static Document decode(std::string_view text, const ReaderOptions& options = ReaderOptions());
    static Document decode_bytes(std::vector<uint8_t> bytes, const ReaderOptions& options = ReaderOptions());
    static Document decode_file(const std::string& path, const ReaderOptions& options = ReaderOptions());

    /// Next row, or std::nullopt at the end of input.
    /// @throws CsvException on malformed input, field count mismatch or I/O failure.
    std::optional<Row> read_row();

    /// Next row wrapped with the header lookup.
    /// @throws CsvException INVALID_HASHABLE_HEADER if header names repeat.
    std::optional<Record> read_record();

    const std::vector<std::string>& headers() const;

    /// Lazily built name lookup; nullptr when there is no header.
    /// @throws CsvException INVALID_HASHABLE_HEADER if header names repeat.
    std::shared_ptr<const HeaderLookup> header_lookup() const;

    /// Number of data rows returned so far.
    size_t row_index() const;

    /// Fields per row, or 0 while unknown.
    size_t expected_fields() const;

    ReaderStatus status() const;

    /// Error that failed the reader, if status() is FAILED.
    const std::optional<CsvError>& failure() const;

    TextEncoding encoding() const;

    /// Field delimiter in use, after inference.
    const std::u32string& field_delimiter() const;

    const ReaderOptions& options() const;

    /// Input iterator over the remaining rows.
    class RowIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Row;
        using difference_type = std::ptrdiff_t;
        using pointer = const Row*;
        using reference = const Row&;

        RowIterator() = default;
        explicit RowIterator(Reader* reader);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        RowIterator& operator++();

        bool operator==(const RowIterator& other) const;
        bool operator!=(const RowIterator& other) const { return !(*this == other); }

    private:
        Reader* reader_ = nullptr;
        std::optional<Row> current_;
    };

    RowIterator begin() { return RowIterator(this); }
    RowIterator end() { return RowIterator(); }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    static Document drain(Reader& reader);
};

}  // namespace unicsv

#endif  // UNICSV_READER_H
