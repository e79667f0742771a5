// include/lcalc/Version.hpp
#pragma once
#include <string_view>


namespace lcalc {

    inline constexpr std::string_view k_version_string = "lcalc v0.1.0";

} // namespace lcalc
