// include/lcalc/parse/Parser.hpp
#pragma once
#include <lcalc/parse/Cursor.hpp>
#include <lcalc/term/Term.hpp>
#include <lcalc/ty/TypePool.hpp>
#include <lcalc/diag/Diagnostic.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>


namespace lcalc {

    /// @brief identifier -> de Bruijn index 매핑.
    /// extended()는 새 컨텍스트를 돌려준다. 기존 항목은 모두 +1, 새 이름은 0.
    /// 같은 이름이 다시 묶이면 안쪽 binder가 이긴다 (shadowing).
    class BindingContext {
    public:
        BindingContext extended(std::string_view name) const {
            BindingContext out = *this;
            out.names_.push_back(name);
            return out;
        }

        std::optional<uint64_t> lookup(std::string_view name) const {
            for (size_t i = names_.size(); i > 0; --i) {
                if (names_[i - 1] == name) return (uint64_t)(names_.size() - i);
            }
            return std::nullopt;
        }

        size_t depth() const {  return names_.size();  }

    private:
        // innermost binder last
        std::vector<std::string_view> names_;
    };

    class Parser {
    public:
        Parser(const std::vector<Token>& tokens, ty::TypePool& types, diag::Bag* diags = nullptr)
            : cursor_(tokens), types_(types), diags_(diags) {
            if (diags_ && diags_->has_code(diag::Code::kInvalidUtf8)) {
                aborted_ = true; // lexer fatal이면 파싱하지 않는다
            }
        }

        /// @brief program := term EOF
        /// @return 실패 시 nullptr. 첫 에러에서 멈춘다.
        term::TermPtr parse_program();

    private:
        struct ParsedType {
            ty::TypeId id = ty::kInvalidType;
            Span span{};
        };

        term::TermPtr parse_term(const BindingContext& ctx);
        term::TermPtr parse_variable(const BindingContext& ctx);
        term::TermPtr parse_abstraction(const Token& lparen, const BindingContext& ctx);
        term::TermPtr parse_application(const Token& lparen, const BindingContext& ctx);

        ParsedType parse_type();
        ParsedType parse_type_atom();

        void report(diag::Code code, Span span, std::string_view a0 = {}, std::string_view a1 = {});
        bool expect(syntax::TokenKind k, std::string_view what);

        // 현재 토큰이 lexer가 만든 kError면 (이미 보고됨) 조용히 중단
        bool stop_on_lex_error();

        std::string_view text_between(size_t first_tok, size_t last_tok) const;

        Cursor cursor_;
        ty::TypePool& types_;
        diag::Bag* diags_ = nullptr;

        bool aborted_ = false;
    };

    /// @brief lex + parse 한 번에. 실패하면 nullptr, 진단은 bag에 쌓인다.
    term::TermPtr parse_source(std::string_view text, uint32_t file_id, ty::TypePool& types, diag::Bag& bag);

} // namespace lcalc
