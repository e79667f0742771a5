// include/lcalc/diag/Diagnostic.hpp
#pragma once
#include <lcalc/text/Span.hpp>
#include <lcalc/diag/DiagCode.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace lcalc::diag {

    /// @brief 코드 + 위치 + 템플릿 인자({0}, {1}, ...). 메시지 문자열은 Render가 만든다.
    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }
        void add_arg_int(uint64_t v)     {  args_.push_back(std::to_string(v));  }

        Severity severity() const {  return severity_;  }
        Code code() const         {  return code_;  }
        Span span() const         {  return span_;  }
        const std::vector<std::string>& args() const {  return args_;  }

    private:
        Severity severity_;
        Code code_;
        Span span_;
        std::vector<std::string> args_;
    };

    class Bag {
    public:
        void add(Diagnostic d) {  diags_.push_back(std::move(d));  }

        // 모든 severity가 오류다 (kError, kFatal)
        bool has_error() const {  return !diags_.empty();  }

        bool has_fatal() const {
            return std::any_of(diags_.begin(), diags_.end(),
                               [](const Diagnostic& d) { return d.severity() == Severity::kFatal; });
        }

        bool has_code(Code c) const {  return first_with(c) != nullptr;  }

        const Diagnostic* first_with(Code c) const {
            auto it = std::find_if(diags_.begin(), diags_.end(),
                                   [c](const Diagnostic& d) { return d.code() == c; });
            return it == diags_.end() ? nullptr : &*it;
        }

        size_t size() const {  return diags_.size();  }
        const std::vector<Diagnostic>& diags() const {  return diags_;  }

    private:
        std::vector<Diagnostic> diags_;
    };

} // namespace lcalc::diag
