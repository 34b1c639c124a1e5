#ifndef UNICSV_ERROR_H
#define UNICSV_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace unicsv {

// Broad error categories. The numeric values are stable and part of the API.
enum class ErrorKind {
    INVALID_CONFIGURATION = 1,  // Options rejected before any data is processed
    INVALID_INPUT = 2,          // Data does not follow the configured dialect
    STREAM_FAILURE = 4,         // Underlying source or sink failed
    INVALID_OPERATION = 5       // API call not allowed in the current state
};

// Specific error conditions
enum class ErrorCode {
    NONE = 0,

    // Configuration errors
    INVALID_DELIMITERS,          // Field delimiter equals a row delimiter
    EMPTY_DELIMITER,             // Writer delimiter is empty
    SAME_DELIMITERS,             // Writer field and row delimiters are equal
    INVALID_TRIM_CHARACTERS,     // Trim set overlaps delimiters or escaping scalar
    UNSUPPORTED_ENCODING,        // Encoding has no decoder/encoder
    MISMATCHED_ENCODING,         // Declared encoding contradicts the BOM
    UNSUPPORTED_INFERENCE,       // Requested inference is not available
    INVALID_EMPTY_HEADER,        // Header row is empty

    // Input errors
    INVALID_UNESCAPED_FIELD,     // Escaping scalar inside an unescaped field
    INVALID_ESCAPED_FIELD,       // Unexpected scalar after a closing escape
    INVALID_EOF,                 // Escaped field not closed before EOF
    INVALID_FIELD_COUNT,         // Row width differs from the first row
    INVALID_HASHABLE_HEADER,     // Duplicate header names in a lookup
    INVALID_ASCII,               // Byte or scalar outside 7-bit ASCII
    INVALID_UTF8,                // Malformed UTF-8 sequence
    INVALID_UTF16,               // Unpaired surrogate in UTF-16
    INVALID_UTF32,               // Code unit is not a Unicode scalar
    INVALID_PRIVILEGE_CHARACTER, // Field holds a delimiter but escaping is off

    // Stream errors
    INCOMPLETE_UTF16,            // Odd trailing byte at EOF
    INCOMPLETE_UTF32,            // Short trailing code unit at EOF
    STREAM_OPEN_FAILURE,         // File could not be opened
    STREAM_READ_FAILURE,         // Source reported a read error
    STREAM_EMPTY_WRITE,          // Sink kept accepting zero bytes
    STREAM_WRITE_FAILURE,        // Sink reported a write error

    // Operation errors
    FIELD_OVERFLOW,              // More fields than the established row width
    ROW_COMPLETION_ON_EMPTY_FILE,// Empty row requested before the width is known
    WRITE_AFTER_CLOSE            // Write attempted after end_file()
};

// Detailed error information
struct CsvError {
    ErrorCode code = ErrorCode::NONE;
    std::string message;  // What went wrong
    std::string help;     // Hint for fixing it, may be empty

    // Location information, 1-indexed. Zero means unknown.
    size_t row = 0;
    size_t field = 0;

    CsvError() = default;
    CsvError(ErrorCode c, std::string msg, std::string hint = "",
             size_t r = 0, size_t f = 0)
        : code(c), message(std::move(msg)), help(std::move(hint)), row(r), field(f) {}

    ErrorKind kind() const;

    // Convert error to string
    std::string to_string() const;
};

// Exception thrown by every failing reader/writer operation
class CsvException : public std::runtime_error {
public:
    explicit CsvException(const CsvError& error)
        : std::runtime_error(error.to_string()), error_(error) {}

    CsvException(ErrorCode code, const std::string& message, const std::string& help = "")
        : CsvException(CsvError(code, message, help)) {}

    const CsvError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }
    ErrorKind kind() const { return error_.kind(); }

private:
    CsvError error_;
};

// Helper functions
ErrorKind error_kind(ErrorCode code);
const char* error_code_to_string(ErrorCode code);
const char* error_kind_to_string(ErrorKind kind);

}  // namespace unicsv

#endif  // UNICSV_ERROR_H
