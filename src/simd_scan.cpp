#include "unicsv/simd_scan.h"

#include "hwy/highway.h"

namespace unicsv {

// Namespace alias for Highway operations
namespace hn = hwy::HWY_NAMESPACE;

namespace {

HWY_ATTR size_t find_any_byte_simd(const uint8_t* data, size_t len,
                                   const uint8_t* needles, size_t needle_count) {
    const hn::ScalableTag<uint8_t> d;
    const size_t N = hn::Lanes(d);

    size_t i = 0;
    for (; i + N <= len; i += N) {
        const auto vec = hn::LoadU(d, data + i);
        auto hits = hn::Eq(vec, hn::Set(d, needles[0]));
        for (size_t k = 1; k < needle_count; ++k) {
            hits = hn::Or(hits, hn::Eq(vec, hn::Set(d, needles[k])));
        }
        const intptr_t first = hn::FindFirstTrue(d, hits);
        if (first >= 0) {
            return i + static_cast<size_t>(first);
        }
    }

    // Handle remaining bytes with scalar code
    for (; i < len; ++i) {
        for (size_t k = 0; k < needle_count; ++k) {
            if (data[i] == needles[k]) return i;
        }
    }
    return len;
}

}  // namespace

size_t find_any_byte(const uint8_t* data, size_t len,
                     const uint8_t* needles, size_t needle_count) {
    if (needle_count == 0 || len == 0) return len;
    return find_any_byte_simd(data, len, needles, needle_count);
}

const char* simd_target_name() {
    return hwy::TargetName(HWY_TARGET);
}

}  // namespace unicsv
