// include/lcalc/lex/Lexer.hpp
#pragma once
#include <lcalc/lex/Token.hpp>
#include <lcalc/diag/Diagnostic.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace lcalc {

    class Lexer {
    public:
        Lexer(std::string_view source, std::uint32_t file_id)
            : Lexer(source, file_id, nullptr) {}

        Lexer(std::string_view source, std::uint32_t file_id, diag::Bag* diags);

        /// @brief 전체 입력을 토큰화한다. 항상 kEof 토큰으로 끝난다.
        std::vector<Token> lex_all();

    private:
        char peek(size_t k = 0) const;
        bool eof() const;
        char bump();

        void skip_ws();

        Token lex_ident();
        Token lex_punct_or_unknown();

        Token make_(syntax::TokenKind kind, size_t lo, size_t hi) const;
        void emit_eof(std::vector<Token>& out);

        bool validate_utf8_all(uint32_t& bad_off) const;
        void report_invalid_utf8(uint32_t bad_off);

        std::string_view source_;
        uint32_t file_id_ = 0;
        size_t pos_ = 0;

        diag::Bag* diags_ = nullptr;
    };

} // namespace lcalc
