// include/lcalc/os/File.hpp
#pragma once
#include <string>


namespace lcalc {

    /// @brief term 파일을 읽는다.
    /// @details 일반 파일만 허용. CR과 선두 UTF-8 BOM은 제거한다.
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 표시용 절대 경로. 실패하면 입력을 그대로 돌려준다.
    std::string normalize_path(const std::string& path);

} // namespace lcalc
