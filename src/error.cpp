#include "unicsv/error.h"
#include <sstream>

namespace unicsv {

ErrorKind error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
        case ErrorCode::INVALID_DELIMITERS:
        case ErrorCode::EMPTY_DELIMITER:
        case ErrorCode::SAME_DELIMITERS:
        case ErrorCode::INVALID_TRIM_CHARACTERS:
        case ErrorCode::UNSUPPORTED_ENCODING:
        case ErrorCode::MISMATCHED_ENCODING:
        case ErrorCode::UNSUPPORTED_INFERENCE:
        case ErrorCode::INVALID_EMPTY_HEADER:
            return ErrorKind::INVALID_CONFIGURATION;
        case ErrorCode::INVALID_UNESCAPED_FIELD:
        case ErrorCode::INVALID_ESCAPED_FIELD:
        case ErrorCode::INVALID_EOF:
        case ErrorCode::INVALID_FIELD_COUNT:
        case ErrorCode::INVALID_HASHABLE_HEADER:
        case ErrorCode::INVALID_ASCII:
        case ErrorCode::INVALID_UTF8:
        case ErrorCode::INVALID_UTF16:
        case ErrorCode::INVALID_UTF32:
        case ErrorCode::INVALID_PRIVILEGE_CHARACTER:
            return ErrorKind::INVALID_INPUT;
        case ErrorCode::INCOMPLETE_UTF16:
        case ErrorCode::INCOMPLETE_UTF32:
        case ErrorCode::STREAM_OPEN_FAILURE:
        case ErrorCode::STREAM_READ_FAILURE:
        case ErrorCode::STREAM_EMPTY_WRITE:
        case ErrorCode::STREAM_WRITE_FAILURE:
            return ErrorKind::STREAM_FAILURE;
        case ErrorCode::FIELD_OVERFLOW:
        case ErrorCode::ROW_COMPLETION_ON_EMPTY_FILE:
        case ErrorCode::WRITE_AFTER_CLOSE:
            return ErrorKind::INVALID_OPERATION;
    }
    return ErrorKind::INVALID_OPERATION;
}

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_DELIMITERS: return "INVALID_DELIMITERS";
        case ErrorCode::EMPTY_DELIMITER: return "EMPTY_DELIMITER";
        case ErrorCode::SAME_DELIMITERS: return "SAME_DELIMITERS";
        case ErrorCode::INVALID_TRIM_CHARACTERS: return "INVALID_TRIM_CHARACTERS";
        case ErrorCode::UNSUPPORTED_ENCODING: return "UNSUPPORTED_ENCODING";
        case ErrorCode::MISMATCHED_ENCODING: return "MISMATCHED_ENCODING";
        case ErrorCode::UNSUPPORTED_INFERENCE: return "UNSUPPORTED_INFERENCE";
        case ErrorCode::INVALID_EMPTY_HEADER: return "INVALID_EMPTY_HEADER";
        case ErrorCode::INVALID_UNESCAPED_FIELD: return "INVALID_UNESCAPED_FIELD";
        case ErrorCode::INVALID_ESCAPED_FIELD: return "INVALID_ESCAPED_FIELD";
        case ErrorCode::INVALID_EOF: return "INVALID_EOF";
        case ErrorCode::INVALID_FIELD_COUNT: return "INVALID_FIELD_COUNT";
        case ErrorCode::INVALID_HASHABLE_HEADER: return "INVALID_HASHABLE_HEADER";
        case ErrorCode::INVALID_ASCII: return "INVALID_ASCII";
        case ErrorCode::INVALID_UTF8: return "INVALID_UTF8";
        case ErrorCode::INVALID_UTF16: return "INVALID_UTF16";
        case ErrorCode::INVALID_UTF32: return "INVALID_UTF32";
        case ErrorCode::INVALID_PRIVILEGE_CHARACTER: return "INVALID_PRIVILEGE_CHARACTER";
        case ErrorCode::INCOMPLETE_UTF16: return "INCOMPLETE_UTF16";
        case ErrorCode::INCOMPLETE_UTF32: return "INCOMPLETE_UTF32";
        case ErrorCode::STREAM_OPEN_FAILURE: return "STREAM_OPEN_FAILURE";
        case ErrorCode::STREAM_READ_FAILURE: return "STREAM_READ_FAILURE";
        case ErrorCode::STREAM_EMPTY_WRITE: return "STREAM_EMPTY_WRITE";
        case ErrorCode::STREAM_WRITE_FAILURE: return "STREAM_WRITE_FAILURE";
        case ErrorCode::FIELD_OVERFLOW: return "FIELD_OVERFLOW";
        case ErrorCode::ROW_COMPLETION_ON_EMPTY_FILE: return "ROW_COMPLETION_ON_EMPTY_FILE";
        case ErrorCode::WRITE_AFTER_CLOSE: return "WRITE_AFTER_CLOSE";
        default: return "UNKNOWN";
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::STREAM_FAILURE: return "STREAM_FAILURE";
        case ErrorKind::INVALID_OPERATION: return "INVALID_OPERATION";
        default: return "UNKNOWN";
    }
}

ErrorKind CsvError::kind() const {
    return error_kind(code);
}

std::string CsvError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_kind_to_string(kind()) << "] "
       << error_code_to_string(code);
    if (row > 0) {
        ss << " at row " << row;
        if (field > 0) ss << ", field " << field;
    }
    ss << ": " << message;

    if (!help.empty()) {
        ss << "\n  Help: " << help;
    }

    return ss.str();
}

}  // namespace unicsv
