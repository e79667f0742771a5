// src/text/source_manager.cpp
#include <lcalc/text/SourceManager.hpp>

#include <algorithm>
#include <iterator>


namespace lcalc {

    // continuation byte (10xxxxxx)는 칸을 차지하지 않는다
    uint32_t SourceManager::columns_(std::string_view s) {
        return static_cast<uint32_t>(std::count_if(s.begin(), s.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.text = std::move(content);
        f.line_starts.push_back(0);
        for (size_t i = 0; i < f.text.size(); ++i) {
            if (f.text[i] == '\n') f.line_starts.push_back(static_cast<uint32_t>(i + 1));
        }

        files_.push_back(std::move(f));
        return static_cast<uint32_t>(files_.size() - 1);
    }

    uint32_t SourceManager::line_of_(const File& f, uint32_t byte_off) {
        auto it = std::upper_bound(f.line_starts.begin(), f.line_starts.end(), byte_off);
        return static_cast<uint32_t>(std::distance(f.line_starts.begin(), it) - 1);
    }

    std::string_view SourceManager::line_text_(const File& f, uint32_t line) {
        const uint32_t lo = f.line_starts[line];
        const uint32_t hi = (line + 1 < f.line_starts.size())
            ? f.line_starts[line + 1] - 1
            : static_cast<uint32_t>(f.text.size());
        return std::string_view(f.text).substr(lo, hi - lo);
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        const File& f = files_[file_id];
        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f.text.size()));
        const uint32_t line = line_of_(f, off);
        const uint32_t start = f.line_starts[line];

        LineCol lc;
        lc.line = line + 1;
        lc.col = columns_(std::string_view(f.text).substr(start, off - start)) + 1;
        return lc;
    }

    SnippetBlock SourceManager::snippet(const Span& sp, uint32_t context_lines) const {
        const File& f = files_[sp.file_id];
        const uint32_t size = static_cast<uint32_t>(f.text.size());
        const uint32_t lo = std::min(sp.lo, size);
        const uint32_t hi = std::max(lo, std::min(sp.hi, size));

        const uint32_t caret_line = line_of_(f, lo);
        const uint32_t last_line = static_cast<uint32_t>(f.line_starts.size()) - 1;
        const uint32_t first = (caret_line > context_lines) ? caret_line - context_lines : 0;
        const uint32_t last = std::min(caret_line + context_lines, last_line);

        SnippetBlock blk;
        blk.first_line_no = first + 1;
        for (uint32_t i = first; i <= last; ++i) blk.lines.push_back(line_text_(f, i));
        blk.caret_line_offset = caret_line - first;

        // 여러 줄에 걸친 span은 caret 줄 끝에서 자른다
        const std::string_view text = line_text_(f, caret_line);
        const uint32_t a = lo - f.line_starts[caret_line];
        const uint32_t b = std::min<uint32_t>(hi - f.line_starts[caret_line], static_cast<uint32_t>(text.size()));
        blk.caret_cols_before = columns_(text.substr(0, a));
        blk.caret_cols_len = std::max<uint32_t>(columns_(text.substr(a, b - a)), 1);
        return blk;
    }

} // namespace lcalc
