/**
 * @file delimiter.h
 * @brief Matching of single and multi-scalar delimiters with pushback.
 */

#ifndef UNICSV_DELIMITER_H
#define UNICSV_DELIMITER_H

#include "unicsv/scalar_buffer.h"
#include "unicsv/scalar_decoder.h"

#include <cstddef>
#include <string>
#include <vector>

namespace unicsv {

/**
 * @brief Decides whether the upcoming scalars form a delimiter.
 *
 * A matcher holds one or more alternative delimiters. Given the scalar that
 * was just read, matches() reads as many further scalars as needed (buffer
 * first, then decoder) and pushes back everything that is not part of the
 * matched delimiter.
 *
 * Alternatives are tried shortest first. When every alternative is a single
 * scalar, matching is a plain comparison and never touches the buffer.
 */
class DelimiterMatcher {
public:
    /// @param alternatives Non-empty delimiter sequences
    explicit DelimiterMatcher(std::vector<std::u32string> alternatives);
    explicit DelimiterMatcher(std::u32string delimiter)
        : DelimiterMatcher(std::vector<std::u32string>{std::move(delimiter)}) {}

    /**
     * @brief Test whether first starts one of the delimiters.
     *
     * On success the remaining scalars of the matched delimiter are
     * consumed. On failure the buffer and decoder are left as if only first
     * had been read.
     */
    bool matches(char32_t first, ScalarBuffer& buffer, ScalarDecoder& decoder) const;

    /// Every scalar appearing in any alternative.
    const std::u32string& scalars() const { return scalars_; }

    const std::vector<std::u32string>& alternatives() const { return alternatives_; }

private:
    std::vector<std::u32string> alternatives_;  // sorted by length
    std::u32string scalars_;
    size_t max_length_ = 0;
};

}  // namespace unicsv

#endif  // UNICSV_DELIMITER_H
