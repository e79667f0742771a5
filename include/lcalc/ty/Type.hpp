// include/lcalc/ty/Type.hpp
#pragma once
#include <cstdint>


namespace lcalc::ty {

    using TypeId = uint32_t;
    inline constexpr TypeId kInvalidType = 0xFFFF'FFFFu;

    enum class Kind : uint8_t {
        kError,
        kBase,      // opaque atom: A, B, Nat ...
        kFn,        // (param)→ret
    };

    struct Type {
        Kind kind = Kind::kError;

        // kBase: index into TypePool name table
        uint32_t name_index = 0;

        // kFn
        TypeId param = kInvalidType;
        TypeId ret = kInvalidType;
    };

} // namespace lcalc::ty
