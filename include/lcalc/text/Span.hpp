// include/lcalc/text/Span.hpp
#pragma once
#include <cstdint>


namespace lcalc {

    // file_id for diagnostics that do not point into any source buffer
    inline constexpr uint32_t k_no_file = 0xFFFF'FFFFu;

    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive
    };

    /// @brief 두 span을 덮는 최소 span (file_id는 a 기준)
    inline Span join(const Span& a, const Span& b) {
        Span out = a;
        if (b.lo < out.lo) out.lo = b.lo;
        if (b.hi > out.hi) out.hi = b.hi;
        return out;
    }

} // namespace lcalc
