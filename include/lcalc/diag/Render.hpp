// include/lcalc/diag/Render.hpp
#pragma once
#include <lcalc/diag/Diagnostic.hpp>
#include <lcalc/text/SourceManager.hpp>

#include <string>
#include <string_view>


namespace lcalc::diag {

    std::string_view code_name(Code c);

    /// @brief 코드 템플릿에 인자를 채운 메시지 본문만 반환한다.
    std::string render_message(const Diagnostic& d);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, const SourceManager& sm, uint32_t context_lines);

} // namespace lcalc::diag
