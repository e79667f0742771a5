// src/diag/render.cpp
#include <lcalc/diag/Render.hpp>

#include <charconv>
#include <sstream>
#include <system_error>


namespace lcalc::diag {

    static uint32_t digits10(uint32_t v) {
        return static_cast<uint32_t>(std::to_string(v).size());
    }

    // "{N}"을 args[N]으로 바꾼다. 범위 밖 번호는 원문 그대로 둔다.
    static std::string format_template(std::string_view templ, const std::vector<std::string>& args) {
        std::string out;
        out.reserve(templ.size());
        size_t i = 0;
        while (i < templ.size()) {
            const size_t close = templ.find('}', i);
            if (templ[i] == '{' && close != std::string_view::npos && close > i + 1) {
                size_t n = 0;
                const auto digits = templ.substr(i + 1, close - i - 1);
                const auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
                if (ec == std::errc{} && p == digits.data() + digits.size() && n < args.size()) {
                    out += args[n];
                    i = close + 1;
                    continue;
                }
            }
            out.push_back(templ[i++]);
        }
        return out;
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "InvalidUtf8";
            case Code::kUnknownCharacter: return "UnknownCharacter";
            case Code::kExpectedToken: return "ExpectedToken";
            case Code::kUnexpectedToken: return "UnexpectedToken";
            case Code::kUnexpectedEof: return "UnexpectedEof";
            case Code::kTrailingInput: return "TrailingInput";
            case Code::kBinderNameExpected: return "BinderNameExpected";
            case Code::kApplicationNeedsArgument: return "ApplicationNeedsArgument";
            case Code::kTypeExpected: return "TypeExpected";

            case Code::kUnboundVariable: return "UnboundVariable";

            case Code::kTypeInvalidApplication: return "TypeInvalidApplication";
            case Code::kTypeAnnotationRequired: return "TypeAnnotationRequired";
            case Code::kTypeUnboundIndex: return "TypeUnboundIndex";

            case Code::kReduceStepBudget: return "ReduceStepBudget";
            case Code::kReduceSizeBudget: return "ReduceSizeBudget";
            case Code::kReduceStuck: return "ReduceStuck";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=byte offset, {1}=byte hex
            case Code::kInvalidUtf8: return "invalid UTF-8 sequence starting at byte offset {0} (byte=0x{1})";
            case Code::kUnknownCharacter: return "unknown character '{0}'";
            // args: {0}=what, {1}=got
            case Code::kExpectedToken: return "expected {0}, got '{1}'";
            case Code::kUnexpectedToken: return "unexpected token '{0}'";
            case Code::kUnexpectedEof: return "unexpected end of input; expected {0}";
            case Code::kTrailingInput: return "unexpected '{0}' after the end of the term";
            case Code::kBinderNameExpected: return "expected a binder name after the lambda, got '{0}'";
            case Code::kApplicationNeedsArgument: return "application needs at least one argument; '({0})' is not a term";
            case Code::kTypeExpected: return "expected a type, got '{0}'";

            case Code::kUnboundVariable: return "unbound variable '{0}'; no enclosing lambda binds it";

            // args: {0}=function, {1}=function type, {2}=argument, {3}=argument type
            case Code::kTypeInvalidApplication: return "attempted to apply term ({0}):{1} to term ({2}):{3}";
            case Code::kTypeAnnotationRequired: return "binder has no type annotation; every lambda of a typed term must declare its argument type";
            case Code::kTypeUnboundIndex: return "variable index {0} escapes a typing context of depth {1}";

            case Code::kReduceStepBudget: return "no normal form reached within {0} reduction steps";
            case Code::kReduceSizeBudget: return "reduction produced a term larger than {0} nodes";
            case Code::kReduceStuck: return "reduction is stuck: variable '{0}' is applied to arguments";
        }
        return "unknown diagnostic";
    }

    std::string render_message(const Diagnostic& d) {
        return format_template(template_en(d.code()), d.args());
    }

    static const char* severity_name(Severity sev) {
        return (sev == Severity::kFatal) ? "fatal" : "error";
    }

    std::string render_one_context(const Diagnostic& d, const SourceManager& sm, uint32_t context_lines) {
        std::ostringstream out;
        out << severity_name(d.severity()) << "[" << code_name(d.code()) << "]: " << render_message(d) << "\n";

        // span이 없는 진단 (예: reduction budget)은 본문만 출력
        const Span sp = d.span();
        if (!sm.has(sp.file_id)) return out.str();

        const LineCol lc = sm.line_col(sp.file_id, sp.lo);
        const SnippetBlock blk = sm.snippet(sp, context_lines);
        const uint32_t w = digits10(blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1);
        const std::string gutter(w, ' ');

        out << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        out << "  " << gutter << " |\n";

        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            const std::string num = std::to_string(blk.first_line_no + i);
            out << "  " << std::string(w - num.size(), ' ') << num << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << "  " << gutter << " | "
                    << std::string(blk.caret_cols_before, ' ')
                    << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }
        return out.str();
    }

} // namespace lcalc::diag
