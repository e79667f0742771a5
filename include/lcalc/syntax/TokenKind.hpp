// include/lcalc/syntax/TokenKind.hpp
#pragma once
#include <cstdint>
#include <string_view>


namespace lcalc::syntax {

    enum class TokenKind : uint8_t {
        kEof = 0,
        kError,

        kIdent,

        kLParen,    // (
        kRParen,    // )
        kLambda,    // λ or '\'
        kDot,       // .
        kColon,     // :
        kArrow,     // → or ->
    };

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";
            case TokenKind::kError: return "error";
            case TokenKind::kIdent: return "ident";
            case TokenKind::kLParen: return "(";
            case TokenKind::kRParen: return ")";
            case TokenKind::kLambda: return "λ";
            case TokenKind::kDot: return ".";
            case TokenKind::kColon: return ":";
            case TokenKind::kArrow: return "→";
        }
        return "unknown";
    }

} // namespace lcalc::syntax
