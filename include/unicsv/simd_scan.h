/**
 * @file simd_scan.h
 * @brief Highway-accelerated byte set search.
 *
 * The writer escapes a field when it contains a delimiter or the escaping
 * scalar. In UTF-8 every such sequence starts with a known lead byte, so a
 * vectorized search for those bytes rules out most fields without decoding
 * them.
 */

#ifndef UNICSV_SIMD_SCAN_H
#define UNICSV_SIMD_SCAN_H

#include <cstddef>
#include <cstdint>

namespace unicsv {

/**
 * @brief Position of the first byte of data that equals any of needles.
 *
 * @param data Bytes to search
 * @param len Length of data
 * @param needles Byte values to look for
 * @param needle_count Number of needles (0 never matches)
 * @return Index of the first match, or len if none
 */
size_t find_any_byte(const uint8_t* data, size_t len,
                     const uint8_t* needles, size_t needle_count);

/// Name of the Highway target compiled for the scan, e.g. "AVX2".
const char* simd_target_name();

}  // namespace unicsv

#endif  // UNICSV_SIMD_SCAN_H
