// include/lcalc/parse/Cursor.hpp
#pragma once
#include <lcalc/lex/Token.hpp>

#include <algorithm>
#include <vector>


namespace lcalc {

    /// @brief 토큰 스트림 위의 읽기 위치.
    /// 범위를 넘는 접근은 마지막 토큰(항상 kEof)으로 고정된다.
    class Cursor {
    public:
        explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {}

        const Token& peek(size_t k = 0) const  {  return at_index(pos_ + k);  }
        bool at(syntax::TokenKind k) const      {  return peek().kind == k;  }

        bool eat(syntax::TokenKind k) {
            if (!at(k)) return false;
            advance_();
            return true;
        }

        const Token& bump() {
            const Token& t = peek();
            advance_();
            return t;
        }

        const Token& at_index(size_t i) const {
            return tokens_[std::min(i, tokens_.size() - 1)];
        }

        size_t pos() const {  return pos_;  }

    private:
        void advance_() {
            if (pos_ < tokens_.size()) ++pos_;
        }

        const std::vector<Token>& tokens_;
        size_t pos_ = 0;
    };

} // namespace lcalc
