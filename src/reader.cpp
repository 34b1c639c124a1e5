/**
 * @file reader.cpp
 * @brief Implementation of the scalar-level CSV reader.
 */

#include "unicsv/reader.h"

#include "unicsv/delimiter.h"
#include "unicsv/dialect.h"
#include "unicsv/log.h"
#include "unicsv/scalar_buffer.h"
#include "unicsv/scalar_decoder.h"
#include "unicsv/utf8.h"

#include <algorithm>
#include <utility>

namespace unicsv {

namespace {

bool contains_scalar(std::u32string_view set, char32_t c) {
    return set.find(c) != std::u32string_view::npos;
}

// Checks the options that don't depend on the input.
ReaderOptions validated(const ReaderOptions& options) {
    if (options.row_delimiters.empty() ||
        std::any_of(options.row_delimiters.begin(), options.row_delimiters.end(),
                    [](const std::u32string& d) { return d.empty(); })) {
        throw CsvException(ErrorCode::UNSUPPORTED_INFERENCE,
                           "Row delimiter inference is not supported",
                           "Provide at least one non-empty row delimiter.");
    }
    if (options.header_strategy == HeaderStrategy::INFER) {
        throw CsvException(ErrorCode::UNSUPPORTED_INFERENCE,
                           "Header inference is not supported",
                           "Use HeaderStrategy::NONE or HeaderStrategy::FIRST_LINE.");
    }
    for (const auto& row : options.row_delimiters) {
        if (row == options.field_delimiter) {
            throw CsvException(ErrorCode::INVALID_DELIMITERS,
                               "The field and row delimiters are the same: '" +
                                   to_utf8(row) + "'",
                               "Choose different field and row delimiters.");
        }
        for (char32_t c : row) {
            if (contains_scalar(options.trim_characters, c)) {
                throw CsvException(ErrorCode::INVALID_TRIM_CHARACTERS,
                                   "The trim characters contain a row delimiter scalar");
            }
        }
    }
    for (char32_t c : options.field_delimiter) {
        if (contains_scalar(options.trim_characters, c)) {
            throw CsvException(ErrorCode::INVALID_TRIM_CHARACTERS,
                               "The trim characters contain a field delimiter scalar");
        }
    }
    if (options.escaping && contains_scalar(options.trim_characters, *options.escaping)) {
        throw CsvException(ErrorCode::INVALID_TRIM_CHARACTERS,
                           "The trim characters contain the escaping scalar");
    }
    return options;
}

std::unique_ptr<ByteSource> presampled(std::unique_ptr<ByteSource> source, bool presample) {
    if (!presample) return source;
    return std::make_unique<MemorySource>(read_all(*source));
}

// A field and whether it ended its row.
struct FieldResult {
    std::string value;
    bool row_end;
};

}  // namespace

//-----------------------------------------------------------------------------
// Reader::Impl
//-----------------------------------------------------------------------------

struct Reader::Impl {
    ReaderOptions options;
    ScalarDecoder decoder;
    ScalarBuffer buffer;
    std::u32string field_delimiter;
    DelimiterMatcher field_matcher;
    DelimiterMatcher row_matcher;

    std::vector<std::string> headers;
    mutable std::shared_ptr<const HeaderLookup> lookup;

    size_t rows_parsed = 0;      // rows consumed from the input, header included
    size_t data_rows = 0;        // rows returned to the caller
    size_t expected_fields = 0;  // 0 until the first row or the header sets it
    bool line_blank = false;     // last parsed line held no scalars besides trim ones

    ReaderStatus status = ReaderStatus::ACTIVE;
    std::optional<CsvError> failure;

    Impl(std::unique_ptr<ByteSource> source, const ReaderOptions& opts)
        : options(validated(opts)),
          decoder(ScalarDecoder::open(presampled(std::move(source), opts.presample), opts.encoding)),
          field_delimiter(resolve_field_delimiter()),
          field_matcher(field_delimiter),
          row_matcher(options.row_delimiters) {
        logger()->debug("reader opened: encoding={} field_delimiter='{}' row_delimiters={}",
                        encoding_to_string(decoder.encoding()), to_utf8(field_delimiter),
                        options.row_delimiters.size());
        read_header();
    }

    std::u32string resolve_field_delimiter();
    void read_header();

    std::optional<char32_t> next_scalar() {
        if (auto c = buffer.next()) return c;
        return decoder.next();
    }

    bool is_trim(char32_t c) const { return contains_scalar(options.trim_characters, c); }
    bool is_escape(char32_t c) const { return options.escaping && *options.escaping == c; }

    std::optional<Row> parse_line();
    FieldResult parse_unescaped_field(char32_t first, size_t field_index);
    FieldResult parse_escaped_field(size_t field_index);

    std::optional<Row> read_row();
    [[noreturn]] void fail(const CsvException& e);
};

std::u32string Reader::Impl::resolve_field_delimiter() {
    if (!options.field_delimiter.empty()) {
        return options.field_delimiter;
    }

    DetectionOptions detection;
    detection.sample_size = options.inference_sample_size;
    if (options.escaping) {
        detection.quote_char = *options.escaping;
    } else {
        detection.escaping = false;
    }
    for (const auto& row : options.row_delimiters) {
        if (row.size() == 1) {
            detection.row_delimiter = row[0];
            break;
        }
    }

    std::u32string sample;
    while (sample.size() < detection.sample_size) {
        auto c = decoder.next();
        if (!c) break;
        sample.push_back(*c);
    }
    buffer.push_front(sample);

    DetectionResult result = DialectDetector(detection).detect(sample);
    logger()->debug("inferred field delimiter: {} (score {:.3f}, {} scalars sampled)",
                    result.dialect.to_string(), result.score, sample.size());

    std::u32string inferred(1, result.dialect.delimiter);
    for (const auto& row : options.row_delimiters) {
        if (row == inferred) {
            throw CsvException(ErrorCode::INVALID_DELIMITERS,
                               "The inferred field delimiter equals a row delimiter");
        }
    }
    if (is_trim(result.dialect.delimiter)) {
        throw CsvException(ErrorCode::INVALID_TRIM_CHARACTERS,
                           "The trim characters contain the inferred field delimiter");
    }
    return inferred;
}

void Reader::Impl::read_header() {
    if (options.header_strategy == HeaderStrategy::NONE) return;

    size_t skip = options.header_strategy == HeaderStrategy::LINE_NUMBER ? options.header_line : 0;
    for (size_t i = 0; i < skip; ++i) {
        if (!parse_line()) {
            status = ReaderStatus::FINISHED;
            return;
        }
        ++rows_parsed;
    }

    auto header = parse_line();
    if (!header || (header->size() == 1 && header->front().empty())) {
        throw CsvException(CsvError(ErrorCode::INVALID_EMPTY_HEADER,
                                    "The header row is empty",
                                    "Use HeaderStrategy::NONE for inputs without a header.",
                                    rows_parsed + 1, 0));
    }
    ++rows_parsed;

    if (options.ignore_extra_trailing_delimiter && header->size() > 1 && header->back().empty()) {
        header->pop_back();
    }
    headers = std::move(*header);
    expected_fields = headers.size();
}

std::optional<Row> Reader::Impl::parse_line() {
    Row result;
    line_blank = true;

    while (true) {
        auto c = next_scalar();
        if (!c) {
            // EOF after a delimiter is an unterminated empty field
            if (result.empty()) return std::nullopt;
            result.emplace_back();
            line_blank = false;
            return result;
        }

        if (is_trim(*c)) continue;

        FieldResult field;
        if (is_escape(*c)) {
            field = parse_escaped_field(result.size());
            line_blank = false;
        } else if (field_matcher.matches(*c, buffer, decoder)) {
            field = FieldResult{std::string(), false};
            line_blank = false;
        } else if (row_matcher.matches(*c, buffer, decoder)) {
            field = FieldResult{std::string(), true};
        } else {
            field = parse_unescaped_field(*c, result.size());
            line_blank = false;
        }

        result.push_back(std::move(field.value));
        if (field.row_end) return result;
    }
}

FieldResult Reader::Impl::parse_unescaped_field(char32_t first, size_t field_index) {
    std::u32string field(1, first);
    bool row_end = true;

    while (true) {
        auto c = next_scalar();
        if (!c) break;

        if (is_escape(*c)) {
            throw CsvException(CsvError(ErrorCode::INVALID_UNESCAPED_FIELD,
                                        "The escaping scalar appears inside an unescaped field",
                                        "Escape the whole field, or disable escaping.",
                                        rows_parsed + 1, field_index + 1));
        }
        if (field_matcher.matches(*c, buffer, decoder)) {
            row_end = false;
            break;
        }
        if (row_matcher.matches(*c, buffer, decoder)) break;

        field.push_back(*c);
    }

    size_t end = field.size();
    while (end > 0 && is_trim(field[end - 1])) --end;
    field.resize(end);

    return FieldResult{to_utf8(field), row_end};
}

FieldResult Reader::Impl::parse_escaped_field(size_t field_index) {
    const char32_t escape = *options.escaping;
    std::u32string field;

    while (true) {
        auto c = next_scalar();
        if (!c) {
            throw CsvException(CsvError(ErrorCode::INVALID_EOF,
                                        "The input ended inside an escaped field",
                                        "Close the escaped field before the end of the input.",
                                        rows_parsed + 1, field_index + 1));
        }
        if (*c != escape) {
            field.push_back(*c);
            continue;
        }

        auto next = next_scalar();
        if (next && *next == escape) {
            field.push_back(escape);
            continue;
        }

        // Closing escape: only trim scalars may precede the delimiter
        while (next && is_trim(*next)) next = next_scalar();
        if (!next) return FieldResult{to_utf8(field), true};
        if (field_matcher.matches(*next, buffer, decoder)) return FieldResult{to_utf8(field), false};
        if (row_matcher.matches(*next, buffer, decoder)) return FieldResult{to_utf8(field), true};

        throw CsvException(CsvError(ErrorCode::INVALID_ESCAPED_FIELD,
                                    "An escaped field is not followed by a delimiter",
                                    "Check that the row delimiter matches the input; files "
                                    "ending lines with \\r\\n need \"\\r\\n\" as a row delimiter.",
                                    rows_parsed + 1, field_index + 1));
    }
}

void Reader::Impl::fail(const CsvException& e) {
    CsvError error = e.error();
    if (error.row == 0) error.row = rows_parsed + 1;
    status = ReaderStatus::FAILED;
    failure = error;
    logger()->debug("reader failed: {}", error.to_string());
    throw CsvException(error);
}

std::optional<Row> Reader::Impl::read_row() {
    switch (status) {
        case ReaderStatus::FINISHED:
            return std::nullopt;
        case ReaderStatus::FAILED:
            throw CsvException(*failure);
        case ReaderStatus::ACTIVE:
            break;
    }

    try {
        while (true) {
            auto row = parse_line();
            if (!row) {
                status = ReaderStatus::FINISHED;
                return std::nullopt;
            }
            ++rows_parsed;

            // Blank lines only carry data in single-column files; an escaped
            // empty field ("") is never blank
            if (line_blank && expected_fields != 1) continue;

            if (expected_fields == 0) {
                expected_fields = row->size();
            } else if (row->size() != expected_fields) {
                if (options.ignore_extra_trailing_delimiter &&
                    row->size() == expected_fields + 1 && row->back().empty()) {
                    row->pop_back();
                } else {
                    throw CsvException(CsvError(
                        ErrorCode::INVALID_FIELD_COUNT,
                        "Row has " + std::to_string(row->size()) + " fields but " +
                            std::to_string(expected_fields) + " were expected",
                        "Every row must have as many fields as the first one.",
                        rows_parsed, 0));
                }
            }

            ++data_rows;
            return row;
        }
    } catch (const CsvException& e) {
        fail(e);
    }
}

//-----------------------------------------------------------------------------
// Reader
//-----------------------------------------------------------------------------

Reader::Reader(std::unique_ptr<ByteSource> source, const ReaderOptions& options)
    : impl_(std::make_unique<Impl>(std::move(source), options)) {}

Reader::~Reader() = default;
Reader::Reader(Reader&&) noexcept = default;
Reader& Reader::operator=(Reader&&) noexcept = default;

Reader Reader::from_string(std::string_view text, const ReaderOptions& options) {
    return Reader(std::make_unique<MemorySource>(text), options);
}

Reader Reader::from_bytes(std::vector<uint8_t> bytes, const ReaderOptions& options) {
    return Reader(std::make_unique<MemorySource>(std::move(bytes)), options);
}

Reader Reader::from_file(const std::string& path, const ReaderOptions& options) {
    return Reader(std::make_unique<FileSource>(path), options);
}

Reader Reader::from_stream(std::istream& input, const ReaderOptions& options) {
    return Reader(std::make_unique<StreamSource>(input), options);
}

Document Reader::drain(Reader& reader) {
    std::vector<Row> rows;
    while (auto row = reader.read_row()) {
        rows.push_back(std::move(*row));
    }
    return Document(reader.headers(), std::move(rows));
}

Document Reader::decode(std::string_view text, const ReaderOptions& options) {
    Reader reader = from_string(text, options);
    return drain(reader);
}

Document Reader::decode_bytes(std::vector<uint8_t> bytes, const ReaderOptions& options) {
    Reader reader = from_bytes(std::move(bytes), options);
    return drain(reader);
}

Document Reader::decode_file(const std::string& path, const ReaderOptions& options) {
    Reader reader = from_file(path, options);
    return drain(reader);
}

std::optional<Row> Reader::read_row() {
    return impl_->read_row();
}

std::optional<Record> Reader::read_record() {
    auto lookup = header_lookup();
    auto row = impl_->read_row();
    if (!row) return std::nullopt;
    return Record(std::move(*row), std::move(lookup));
}

const std::vector<std::string>& Reader::headers() const {
    return impl_->headers;
}

std::shared_ptr<const HeaderLookup> Reader::header_lookup() const {
    if (!impl_->lookup && !impl_->headers.empty()) {
        impl_->lookup = std::make_shared<const HeaderLookup>(impl_->headers);
    }
    return impl_->lookup;
}

size_t Reader::row_index() const {
    return impl_->data_rows;
}

size_t Reader::expected_fields() const {
    return impl_->expected_fields;
}

ReaderStatus Reader::status() const {
    return impl_->status;
}

const std::optional<CsvError>& Reader::failure() const {
    return impl_->failure;
}

TextEncoding Reader::encoding() const {
    return impl_->decoder.encoding();
}

const std::u32string& Reader::field_delimiter() const {
    return impl_->field_delimiter;
}

const ReaderOptions& Reader::options() const {
    return impl_->options;
}

//-----------------------------------------------------------------------------
// RowIterator
//-----------------------------------------------------------------------------

Reader::RowIterator::RowIterator(Reader* reader) : reader_(reader) {
    current_ = reader_->read_row();
    if (!current_) reader_ = nullptr;
}

Reader::RowIterator& Reader::RowIterator::operator++() {
    if (reader_) {
        current_ = reader_->read_row();
        if (!current_) reader_ = nullptr;
    }
    return *this;
}

bool Reader::RowIterator::operator==(const RowIterator& other) const {
    return reader_ == other.reader_;
}

}  // namespace unicsv
