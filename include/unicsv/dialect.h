/**
 * @file dialect.h
 * @brief CSV dialect detection for inputs with an unknown field delimiter.
 *
 * The detection algorithm follows CleverCSV's pattern score: each candidate
 * delimiter is used to abstract the sample into cells and delimiters, and the
 * delimiter producing the most uniform row patterns wins.
 *
 * @see DialectDetector for automatic dialect detection
 * @see Dialect for dialect configuration
 */

#ifndef UNICSV_DIALECT_H
#define UNICSV_DIALECT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace unicsv {

/**
 * @brief Single-scalar CSV dialect.
 *
 * - delimiter: field separator (default: comma)
 * - row_delimiter: row separator (default: line feed)
 * - quote_char: escaping scalar (default: double-quote)
 */
struct Dialect {
    char32_t delimiter = U',';
    char32_t row_delimiter = U'\n';
    char32_t quote_char = U'"';

    /// Factory for standard CSV (comma-separated, double-quoted)
    static Dialect csv() { return Dialect{U',', U'\n', U'"'}; }

    /// Factory for TSV (tab-separated)
    static Dialect tsv() { return Dialect{U'\t', U'\n', U'"'}; }

    /// Factory for semicolon-separated (European style)
    static Dialect semicolon() { return Dialect{U';', U'\n', U'"'}; }

    /// Factory for pipe-separated
    static Dialect pipe() { return Dialect{U'|', U'\n', U'"'}; }

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter &&
               row_delimiter == other.row_delimiter &&
               quote_char == other.quote_char;
    }

    bool operator!=(const Dialect& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

/**
 * @brief Configuration options for dialect detection.
 */
struct DetectionOptions {
    /// Candidate delimiters, in tie-breaking order
    std::vector<char32_t> delimiters = {U',', U';', U'\t', U'|'};

    char32_t row_delimiter = U'\n';  ///< Row delimiter assumed while abstracting
    char32_t quote_char = U'"';      ///< Escaping scalar assumed while abstracting
    bool escaping = true;            ///< When false, quote_char is an ordinary scalar
    double epsilon = 0.001;          ///< Floor for single-cell row patterns
    size_t sample_size = 4096;       ///< Scalars the reader samples for detection
};

/// Token of an abstracted CSV sample.
enum class Token {
    CELL,
    FIELD_DELIMITER,
    ROW_DELIMITER
};

/// Irregularities noticed while abstracting a sample.
enum class AbstractionError {
    INVALID_ESCAPE_CHARACTER_POSITION,  ///< e.g. foo,x"bar" or foo,"bar"x
    UNBALANCED_ESCAPE_CHARACTERS        ///< Escaped field still open at EOF
};

/// A sample as seen through one candidate dialect.
struct Abstraction {
    std::vector<Token> tokens;
    std::vector<AbstractionError> errors;
};

/**
 * @brief Candidate dialect with its detection score.
 */
struct DialectCandidate {
    Dialect dialect;
    double pattern_score = 0.0;            ///< Row pattern uniformity
    std::vector<AbstractionError> errors;  ///< Errors met while abstracting
};

/**
 * @brief Result of dialect detection.
 */
struct DetectionResult {
    Dialect dialect;             ///< Best dialect, or Dialect::csv() if nothing scored
    double score = 0.0;          ///< Pattern score of the best dialect

    /// All tested candidates, in the order they were registered
    std::vector<DialectCandidate> candidates;

    /// Returns true if some candidate produced a positive score
    bool success() const { return score > 0.0; }
};

/**
 * @brief CSV field delimiter auto-detector.
 *
 * Implements the pattern-score half of CleverCSV:
 * 1. For each candidate delimiter, abstract the sample into a token string
 *    such as CDCDC R CDCDC
 * 2. Split the tokens into row patterns and count identical rows
 * 3. Score = sum over patterns of count * max(eps, k - 1) / k, divided by the
 *    number of distinct patterns (k is the number of cells in the pattern)
 * 4. Highest score wins; ties go to the earliest candidate
 *
 * @example
 * @code
 * unicsv::DialectDetector detector;
 * auto result = detector.detect(U"a;b;c\nd;e;f\n");
 * // result.dialect.delimiter == U';'
 * @endcode
 */
class DialectDetector {
public:
    explicit DialectDetector(const DetectionOptions& options = DetectionOptions());

    /// Detect the dialect of a sample of scalars.
    DetectionResult detect(std::u32string_view sample) const;

    /// Detect the dialect of a UTF-8 buffer. Decoding stops at the first
    /// malformed sequence, which is usually a sample cut mid-character.
    DetectionResult detect(const uint8_t* buf, size_t len) const;

    /// Abstract a sample with the given field delimiter.
    Abstraction make_abstraction(std::u32string_view sample, char32_t delimiter) const;

    /// Pattern score of an abstraction; 0 for an empty one.
    double pattern_score(const std::vector<Token>& tokens) const;

    static const char* token_to_string(Token token);

    const DetectionOptions& options() const { return options_; }

private:
    DetectionOptions options_;
};

}  // namespace unicsv

#endif  // UNICSV_DIALECT_H
