// include/lcalc/lex/Token.hpp
#pragma once
#include <string_view>
#include <lcalc/text/Span.hpp>
#include <lcalc/syntax/TokenKind.hpp>


namespace lcalc {

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kError;
        Span span{};
        std::string_view lexeme{};
    };

} // namespace lcalc
