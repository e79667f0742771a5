// src/lex/lexer.cpp
#include <lcalc/lex/Lexer.hpp>
#include <lcalc/syntax/TokenKind.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>


namespace lcalc {

    // 선두 바이트가 정하는 시퀀스 길이와 두 번째 바이트의 허용 범위.
    // len == 0 은 시퀀스를 시작할 수 없는 바이트 (continuation, C0/C1, F5..FF).
    struct Utf8Lead {
        uint8_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
    };

    static Utf8Lead utf8_lead(unsigned char b) {
        if (b < 0x80)               return {1, 0, 0};
        if (b >= 0xC2 && b <= 0xDF) return {2, 0x80, 0xBF};
        if (b == 0xE0)              return {3, 0xA0, 0xBF}; // overlong
        if (b == 0xED)              return {3, 0x80, 0x9F}; // surrogates
        if (b >= 0xE1 && b <= 0xEF) return {3, 0x80, 0xBF};
        if (b == 0xF0)              return {4, 0x90, 0xBF}; // overlong
        if (b >= 0xF1 && b <= 0xF3) return {4, 0x80, 0xBF};
        if (b == 0xF4)              return {4, 0x80, 0x8F}; // > U+10FFFF
        return {};
    }

    static bool utf8_first_invalid(std::string_view s, uint32_t& bad_off) {
        size_t i = 0;
        while (i < s.size()) {
            const Utf8Lead lead = utf8_lead(static_cast<unsigned char>(s[i]));

            bool ok = lead.len != 0 && i + lead.len <= s.size();
            if (ok && lead.len > 1) {
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                ok = b1 >= lead.lo && b1 <= lead.hi;
                for (size_t k = 2; ok && k < lead.len; ++k) {
                    ok = (static_cast<unsigned char>(s[i + k]) & 0xC0) == 0x80;
                }
            }

            if (!ok) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            i += lead.len;
        }
        return true;
    }

    // identifiers are drawn from ASCII letters only
    static bool is_ident_char(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    static std::string byte_hex2(unsigned char b) {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string s;
        s.push_back(kHex[(b >> 4) & 0xF]);
        s.push_back(kHex[b & 0xF]);
        return s;
    }

    Lexer::Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    bool Lexer::validate_utf8_all(uint32_t& bad_off) const {
        return utf8_first_invalid(source_, bad_off);
    }

    void Lexer::report_invalid_utf8(uint32_t bad_off) {
        if (!diags_) return;

        const uint32_t hi = std::min<uint32_t>(bad_off + 1, (uint32_t)source_.size());
        Span sp{file_id_, bad_off, hi};

        diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInvalidUtf8, sp);

        // args = offset + offending byte hex
        d.add_arg_int(bad_off);

        unsigned char b = 0;
        if (bad_off < source_.size()) {
            b = static_cast<unsigned char>(source_[bad_off]);
        }
        d.add_arg(byte_hex2(b));

        diags_->add(std::move(d));
    }

    char Lexer::peek(size_t k) const {
        size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Lexer::eof() const {
        return pos_ >= source_.size();
    }

    char Lexer::bump() {
        if (eof()) return '\0';
        return source_[pos_++];
    }

    void Lexer::skip_ws() {
        while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) {
            bump();
        }
    }

    Token Lexer::make_(syntax::TokenKind kind, size_t lo, size_t hi) const {
        Token t;
        t.kind = kind;
        t.span = Span{file_id_, static_cast<uint32_t>(lo), static_cast<uint32_t>(hi)};
        t.lexeme = source_.substr(lo, hi - lo);
        return t;
    }

    Token Lexer::lex_ident() {
        const size_t lo = pos_;
        while (!eof() && is_ident_char(peek())) bump();
        return make_(syntax::TokenKind::kIdent, lo, pos_);
    }

    Token Lexer::lex_punct_or_unknown() {
        using K = syntax::TokenKind;
        const size_t lo = pos_;
        const unsigned char c = static_cast<unsigned char>(peek());

        switch (c) {
            case '(':  bump(); return make_(K::kLParen, lo, pos_);
            case ')':  bump(); return make_(K::kRParen, lo, pos_);
            case '\\': bump(); return make_(K::kLambda, lo, pos_);
            case '.':  bump(); return make_(K::kDot, lo, pos_);
            case ':':  bump(); return make_(K::kColon, lo, pos_);
            default: break;
        }

        // ASCII arrow "->"
        if (c == '-' && peek(1) == '>') {
            bump(); bump();
            return make_(K::kArrow, lo, pos_);
        }

        // λ = U+03BB (CE BB)
        if (c == 0xCE && static_cast<unsigned char>(peek(1)) == 0xBB) {
            bump(); bump();
            return make_(K::kLambda, lo, pos_);
        }

        // → = U+2192 (E2 86 92)
        if (c == 0xE2 &&
            static_cast<unsigned char>(peek(1)) == 0x86 &&
            static_cast<unsigned char>(peek(2)) == 0x92) {
            bump(); bump(); bump();
            return make_(K::kArrow, lo, pos_);
        }

        // unknown char (UTF-8 시퀀스 단위로 소비)
        const size_t n = std::max<size_t>(utf8_lead(c).len, 1);
        for (size_t i = 0; i < n && !eof(); ++i) bump();

        Token bad = make_(K::kError, lo, pos_);
        if (diags_) {
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kUnknownCharacter, bad.span);
            d.add_arg(bad.lexeme);
            diags_->add(std::move(d));
        }
        return bad;
    }

    void Lexer::emit_eof(std::vector<Token>& out) {
        out.push_back(make_(syntax::TokenKind::kEof, source_.size(), source_.size()));
    }

    std::vector<Token> Lexer::lex_all() {
        std::vector<Token> out;
        out.reserve(source_.size() / 2 + 1);

        // invalid UTF-8 이면 어떤 토큰도 신뢰할 수 없으므로 즉시 EOF만 반환
        uint32_t bad_off = 0;
        if (!validate_utf8_all(bad_off)) {
            report_invalid_utf8(bad_off);
            pos_ = source_.size();
            emit_eof(out);
            return out;
        }

        while (true) {
            skip_ws();
            if (eof()) break;

            if (is_ident_char(peek())) {
                out.push_back(lex_ident());
                continue;
            }
            out.push_back(lex_punct_or_unknown());
        }

        emit_eof(out);
        return out;
    }

} // namespace lcalc
