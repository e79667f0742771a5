// include/lcalc/text/SourceManager.hpp
#pragma once
#include <lcalc/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace lcalc {

    struct LineCol {
        uint32_t line = 1; // 1-based
        uint32_t col  = 1; // 1-based, code point 단위 (λ, → 도 한 칸)
    };

    /// @brief caret 줄과 그 위/아래 몇 줄의 원문, 그리고 밑줄 위치
    struct SnippetBlock {
        uint32_t first_line_no = 1;
        std::vector<std::string_view> lines;
        uint32_t caret_line_offset = 0; // lines[] 안에서 caret이 찍힐 줄
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
    };

    class SourceManager {
    public:
        /// @brief 버퍼를 등록하고 file_id를 돌려준다. 이후 content()의 view는 계속 유효하다.
        uint32_t add(std::string name, std::string content);

        bool has(uint32_t file_id) const {  return file_id < files_.size();  }

        std::string_view name(uint32_t file_id) const    {  return files_[file_id].name;  }
        std::string_view content(uint32_t file_id) const {  return files_[file_id].text;  }

        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        SnippetBlock snippet(const Span& sp, uint32_t context_lines) const;

    private:
        struct File {
            std::string name;
            std::string text;
            std::vector<uint32_t> line_starts; // 각 줄의 첫 byte offset, [0] == 0
        };

        static uint32_t line_of_(const File& f, uint32_t byte_off);
        static std::string_view line_text_(const File& f, uint32_t line);
        static uint32_t columns_(std::string_view s);

        std::vector<File> files_;
    };

} // namespace lcalc
