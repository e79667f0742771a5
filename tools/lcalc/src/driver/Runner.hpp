// tools/lcalc/src/driver/Runner.hpp
#pragma once

#include "../cli/Options.hpp"

namespace lcalc::driver {

    /// @brief 파싱/적용/타입체크/리덕션/출력 파이프라인을 실행한다.
    int run(const cli::Options& opt);

} // namespace lcalc::driver
