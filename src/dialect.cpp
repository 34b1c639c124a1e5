#include "unicsv/dialect.h"
#include "unicsv/utf8.h"

#include <algorithm>
#include <map>
#include <optional>
#include <sstream>

namespace unicsv {

namespace {

std::string describe_scalar(char32_t c) {
    switch (c) {
        case U'\t': return "\\t";
        case U'\n': return "\\n";
        case U'\r': return "\\r";
        default: break;
    }
    std::string out;
    utf8_append(out, c);
    return out;
}

}  // namespace

std::string Dialect::to_string() const {
    std::ostringstream ss;
    ss << "delimiter='" << describe_scalar(delimiter)
       << "' row_delimiter='" << describe_scalar(row_delimiter)
       << "' quote='" << describe_scalar(quote_char) << "'";
    return ss.str();
}

DialectDetector::DialectDetector(const DetectionOptions& options)
    : options_(options) {}

const char* DialectDetector::token_to_string(Token token) {
    switch (token) {
        case Token::CELL: return "C";
        case Token::FIELD_DELIMITER: return "D";
        case Token::ROW_DELIMITER: return "R";
    }
    return "?";
}

Abstraction DialectDetector::make_abstraction(std::u32string_view sample,
                                              char32_t delimiter) const {
    Abstraction result;
    auto& tokens = result.tokens;
    const char32_t row_delimiter = options_.row_delimiter;
    const char32_t quote = options_.quote_char;

    auto last_is = [&tokens](Token t) { return !tokens.empty() && tokens.back() == t; };

    bool escaped = false;
    size_t i = 0;
    std::optional<char32_t> queued;

    while (true) {
        char32_t c;
        if (queued) {
            c = *queued;
            queued.reset();
        } else if (i < sample.size()) {
            c = sample[i++];
        } else {
            break;
        }

        if (c == delimiter || c == row_delimiter) {
            if (escaped) continue;
            // Delimiter at start, after a delimiter or after a row end implies an empty cell
            if (!last_is(Token::CELL)) tokens.push_back(Token::CELL);
            tokens.push_back(c == delimiter ? Token::FIELD_DELIMITER : Token::ROW_DELIMITER);
        } else if (options_.escaping && c == quote) {
            if (!escaped) {
                if (last_is(Token::CELL)) {
                    result.errors.push_back(AbstractionError::INVALID_ESCAPE_CHARACTER_POSITION);
                }
                escaped = true;
                continue;
            }

            // Inside an escaped field: either a doubled quote or the closing one
            if (i >= sample.size()) {
                escaped = false;
                continue;
            }
            char32_t next = sample[i++];
            if (next == quote) continue;

            escaped = false;
            if (next != delimiter && next != row_delimiter) {
                result.errors.push_back(AbstractionError::INVALID_ESCAPE_CHARACTER_POSITION);
            }
            queued = next;
        } else if (!last_is(Token::CELL)) {
            tokens.push_back(Token::CELL);
        }
    }

    if (last_is(Token::FIELD_DELIMITER)) {
        tokens.push_back(Token::CELL);
    }
    if (escaped) {
        result.errors.push_back(AbstractionError::UNBALANCED_ESCAPE_CHARACTERS);
    }

    return result;
}

double DialectDetector::pattern_score(const std::vector<Token>& tokens) const {
    // Row patterns and how often each occurs; empty rows are dropped
    std::map<std::vector<Token>, size_t> counts;
    std::vector<Token> row;
    for (Token t : tokens) {
        if (t == Token::ROW_DELIMITER) {
            if (!row.empty()) ++counts[row];
            row.clear();
        } else {
            row.push_back(t);
        }
    }
    if (!row.empty()) ++counts[row];

    if (counts.empty()) return 0.0;

    double score = 0.0;
    for (const auto& [pattern, count] : counts) {
        double cells = static_cast<double>(std::count(pattern.begin(), pattern.end(), Token::CELL));
        if (cells == 0.0) continue;
        score += static_cast<double>(count) * std::max(options_.epsilon, cells - 1.0) / cells;
    }
    return score / static_cast<double>(counts.size());
}

DetectionResult DialectDetector::detect(std::u32string_view sample) const {
    DetectionResult result;
    result.dialect = Dialect{U',', options_.row_delimiter, options_.quote_char};

    bool found = false;
    for (char32_t delimiter : options_.delimiters) {
        DialectCandidate candidate;
        candidate.dialect = Dialect{delimiter, options_.row_delimiter, options_.quote_char};
        Abstraction abstraction = make_abstraction(sample, delimiter);
        candidate.pattern_score = pattern_score(abstraction.tokens);
        candidate.errors = std::move(abstraction.errors);

        if (!found || candidate.pattern_score > result.score) {
            result.dialect = candidate.dialect;
            result.score = candidate.pattern_score;
            found = true;
        }
        result.candidates.push_back(std::move(candidate));
    }

    return result;
}

DetectionResult DialectDetector::detect(const uint8_t* buf, size_t len) const {
    std::string_view bytes(reinterpret_cast<const char*>(buf), len);
    std::u32string sample;
    sample.reserve(len);
    size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t c = 0;
        size_t n = utf8_decode(bytes, pos, c);
        if (n == 0) break;
        sample.push_back(c);
        pos += n;
    }
    return detect(sample);
}

}  // namespace unicsv
