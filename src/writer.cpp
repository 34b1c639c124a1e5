/**
 * @file writer.cpp
 * @brief Implementation of the scalar-level CSV writer.
 */

#include "unicsv/writer.h"

#include "unicsv/error.h"
#include "unicsv/log.h"
#include "unicsv/scalar_encoder.h"
#include "unicsv/simd_scan.h"
#include "unicsv/utf8.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

namespace unicsv {

namespace {

const WriterOptions& validated(const WriterOptions& options) {
    if (options.field_delimiter.empty() || options.row_delimiter.empty()) {
        throw CsvException(ErrorCode::EMPTY_DELIMITER,
                           "Delimiters can't be empty when writing",
                           "Set both the field and the row delimiter.");
    }
    if (options.field_delimiter == options.row_delimiter) {
        throw CsvException(ErrorCode::SAME_DELIMITERS,
                           "The field and row delimiters are the same: '" +
                               to_utf8(options.field_delimiter) + "'");
    }
    return options;
}

// A field checked and ready to be written.
struct PreparedField {
    std::u32string scalars;
    bool escaped;
};

// True if a reader would find a delimiter that starts inside field, once the
// delimiter written after it is appended.
bool splits_early(const std::u32string& field, const std::u32string& field_delimiter,
                  const std::u32string& row_delimiter) {
    for (const auto* next : {&field_delimiter, &row_delimiter}) {
        std::u32string written = field + *next;
        if (written.find(field_delimiter) < field.size() ||
            written.find(row_delimiter) < field.size()) {
            return true;
        }
    }
    return false;
}

}  // namespace

struct Writer::Impl {
    WriterOptions options;
    ScalarEncoder encoder;
    MemorySink* memory = nullptr;  // set when the encoder's sink is a MemorySink
    bool emit_bom;

    // Scalars that make a field need escaping: delimiter leads, the escaping
    // scalar and line breaks. lead_bytes holds their first UTF-8 bytes.
    std::u32string special_scalars;
    std::vector<uint8_t> lead_bytes;

    WriterState state = WriterState::UNBEGUN;
    size_t row_index = 0;
    size_t field_index = 0;       // 0 means the row is unstarted
    size_t expected_fields = 0;   // 0 until the first row or the headers set it
    bool last_field_bare = false; // last field emitted wrote no scalars

    Impl(std::unique_ptr<ByteSink> sink, const WriterOptions& opts, bool bom)
        : options(validated(opts)),
          encoder(std::move(sink), opts.encoding.value_or(TextEncoding::UTF8)),
          emit_bom(bom) {
        std::u32string candidates{options.field_delimiter[0], options.row_delimiter[0], U'\r', U'\n'};
        if (options.escaping) candidates.push_back(*options.escaping);
        for (char32_t c : candidates) {
            if (special_scalars.find(c) != std::u32string::npos) continue;
            special_scalars.push_back(c);
            uint8_t bytes[4];
            if (utf8_encode(c, bytes) > 0 &&
                std::find(lead_bytes.begin(), lead_bytes.end(), bytes[0]) == lead_bytes.end()) {
                lead_bytes.push_back(bytes[0]);
            }
        }

        // Delimiters are written between fields, so they must encode before any row starts
        for (char32_t c : options.field_delimiter) encoder.check_encodable(c);
        for (char32_t c : options.row_delimiter) encoder.check_encodable(c);
        if (options.escaping) encoder.check_encodable(*options.escaping);
    }

    void ensure_writable() {
        if (state == WriterState::CLOSED) {
            throw CsvException(ErrorCode::WRITE_AFTER_CLOSE,
                               "The writer was closed with end_file()");
        }
        if (state == WriterState::UNBEGUN) {
            if (emit_bom) encoder.write_bom(options.bom_strategy);
            state = WriterState::ACTIVE;
        }
    }

    // position is the 1-based field number the field will take in its row
    PreparedField prepare(std::string_view field, size_t position) const {
        PreparedField prepared{from_utf8(field), false};
        if (prepared.scalars.empty()) return prepared;

        try {
            for (char32_t c : prepared.scalars) encoder.check_encodable(c);
        } catch (const CsvException& e) {
            CsvError error = e.error();
            error.row = row_index + 1;
            error.field = position;
            throw CsvException(error);
        }

        // Most fields hold none of the lead bytes and need no scalar search
        const auto* bytes = reinterpret_cast<const uint8_t*>(field.data());
        bool special = find_any_byte(bytes, field.size(), lead_bytes.data(), lead_bytes.size()) != field.size() &&
                       prepared.scalars.find_first_of(special_scalars) != std::u32string::npos;

        if (!options.escaping) {
            if (special && splits_early(prepared.scalars, options.field_delimiter, options.row_delimiter)) {
                throw CsvException(CsvError(
                    ErrorCode::INVALID_PRIVILEGE_CHARACTER,
                    "Field would be split by a delimiter but escaping is disabled: '" +
                        std::string(field) + "'",
                    "Enable escaping or remove delimiters from the field.",
                    row_index + 1, position));
            }
            return prepared;
        }

        prepared.escaped = special || options.escape_all_fields;
        return prepared;
    }

    void emit(const PreparedField& field) {
        if (field_index > 0) encoder.encode(options.field_delimiter);
        if (field.escaped) {
            const char32_t escape = *options.escaping;
            encoder.encode(escape);
            for (char32_t c : field.scalars) {
                if (c == escape) encoder.encode(escape);
                encoder.encode(c);
            }
            encoder.encode(escape);
        } else {
            encoder.encode(field.scalars);
        }
        last_field_bare = field.scalars.empty() && !field.escaped;
        ++field_index;
    }

    // A row made of one empty field is written as an escaped empty field, so
    // that readers don't take it for a blank line.
    void emit_lone_empty_field() {
        if (!options.escaping) return;
        encoder.encode(*options.escaping);
        encoder.encode(*options.escaping);
    }

    void check_room(size_t count) const {
        if (expected_fields > 0 && field_index + count > expected_fields) {
            throw CsvException(CsvError(
                ErrorCode::FIELD_OVERFLOW,
                "Writing " + std::to_string(count) + " field(s) would exceed the row width of " +
                    std::to_string(expected_fields),
                "", row_index + 1, field_index + 1));
        }
    }

    void write_field(std::string_view field) {
        ensure_writable();
        check_room(1);
        emit(prepare(field, field_index + 1));
    }

    void write_fields(const std::vector<std::string>& fields) {
        ensure_writable();
        check_room(fields.size());
        std::vector<PreparedField> prepared;
        prepared.reserve(fields.size());
        for (const auto& f : fields) prepared.push_back(prepare(f, field_index + prepared.size() + 1));
        for (const auto& p : prepared) emit(p);
    }

    void end_row() {
        ensure_writable();
        if (field_index == 0) {
            write_empty_row();
            return;
        }
        if (field_index == 1 && last_field_bare && expected_fields <= 1) {
            emit_lone_empty_field();
        }
        if (expected_fields == 0) {
            expected_fields = field_index;
        } else {
            // Empty fields write nothing, only their delimiter
            for (; field_index < expected_fields; ++field_index) {
                encoder.encode(options.field_delimiter);
            }
        }
        encoder.encode(options.row_delimiter);
        ++row_index;
        field_index = 0;
    }

    void write_empty_row() {
        ensure_writable();
        if (field_index > 0) end_row();
        if (expected_fields == 0) {
            throw CsvException(ErrorCode::ROW_COMPLETION_ON_EMPTY_FILE,
                               "An empty row needs a known row width",
                               "Write a row with fields, or set headers, first.");
        }
        if (expected_fields == 1) emit_lone_empty_field();
        for (size_t i = 1; i < expected_fields; ++i) {
            encoder.encode(options.field_delimiter);
        }
        encoder.encode(options.row_delimiter);
        ++row_index;
    }

    void end_file() {
        if (state == WriterState::CLOSED) return;
        ensure_writable();
        if (field_index > 0) end_row();
        encoder.flush();
        state = WriterState::CLOSED;
    }
};

Writer::Writer(std::unique_ptr<ByteSink> sink, const WriterOptions& options, bool emit_bom) {
    auto* memory = dynamic_cast<MemorySink*>(sink.get());
    impl_ = std::make_unique<Impl>(std::move(sink), options, emit_bom);
    impl_->memory = memory;

    if (!impl_->options.headers.empty()) {
        impl_->write_fields(impl_->options.headers);
        impl_->end_row();
        impl_->row_index = 0;
    }
}

Writer::~Writer() {
    if (!impl_ || impl_->state == WriterState::CLOSED) return;
    try {
        impl_->end_file();
    } catch (const CsvException& e) {
        logger()->error("failed to finish CSV output: {}", e.what());
    }
}

Writer::Writer(Writer&&) noexcept = default;
Writer& Writer::operator=(Writer&&) noexcept = default;

Writer Writer::to_memory(const WriterOptions& options) {
    return Writer(std::make_unique<MemorySink>(), options);
}

Writer Writer::to_stream(std::ostream& output, const WriterOptions& options) {
    return Writer(std::make_unique<StreamSink>(output), options);
}

Writer Writer::to_file(const std::string& path, const WriterOptions& options, bool append) {
    return Writer(std::make_unique<FileSink>(path, append), options, !append);
}

std::vector<uint8_t> Writer::encode_bytes(const std::vector<Row>& rows, const WriterOptions& options) {
    Writer writer = to_memory(options);
    for (const auto& row : rows) {
        writer.write_row(row);
    }
    writer.end_file();
    return writer.data();
}

std::string Writer::encode(const std::vector<Row>& rows, const WriterOptions& options) {
    std::vector<uint8_t> bytes = encode_bytes(rows, options);
    return std::string(bytes.begin(), bytes.end());
}

void Writer::write_field(std::string_view field) {
    impl_->write_field(field);
}

void Writer::write_fields(const std::vector<std::string>& fields) {
    impl_->write_fields(fields);
}

void Writer::write_row(const std::vector<std::string>& fields) {
    impl_->write_fields(fields);
    impl_->end_row();
}

void Writer::end_row() {
    impl_->end_row();
}

void Writer::write_empty_row() {
    impl_->write_empty_row();
}

void Writer::end_file() {
    impl_->end_file();
}

const std::vector<uint8_t>& Writer::data() const {
    if (!impl_->memory) {
        throw std::logic_error("Writer does not write to memory");
    }
    return impl_->memory->data();
}

WriterState Writer::state() const {
    return impl_->state;
}

size_t Writer::row_index() const {
    return impl_->row_index;
}

size_t Writer::field_index() const {
    return impl_->field_index;
}

size_t Writer::expected_fields() const {
    return impl_->expected_fields;
}

TextEncoding Writer::encoding() const {
    return impl_->encoder.encoding();
}

const WriterOptions& Writer::options() const {
    return impl_->options;
}

}  // namespace unicsv
