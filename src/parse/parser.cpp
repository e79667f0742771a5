// src/parse/parser.cpp
#include <lcalc/parse/Parser.hpp>
#include <lcalc/lex/Lexer.hpp>
#include <lcalc/syntax/TokenKind.hpp>


namespace lcalc {

    // --------------------
    // grammar (v0)
    // --------------------
    //
    //  program     := term EOF
    //  term        := Ident
    //               | '(' lambda Ident [ '.' | ':' type '.' ] term ')'
    //               | '(' term term { term } ')'
    //  type        := type_atom [ arrow type ]     (right-assoc)
    //  type_atom   := Ident | '(' type ')'
    //
    // (f a b c) == (((f a) b) c)

    void Parser::report(diag::Code code, Span span, std::string_view a0, std::string_view a1) {
        if (aborted_) return;
        aborted_ = true; // 첫 에러에서 멈춘다

        if (!diags_) return;

        diag::Diagnostic d(diag::Severity::kError, code, span);
        if (!a0.empty()) d.add_arg(a0);
        if (!a1.empty()) d.add_arg(a1);
        diags_->add(std::move(d));
    }

    bool Parser::stop_on_lex_error() {
        if (cursor_.at(syntax::TokenKind::kError)) {
            aborted_ = true;
            return true;
        }
        return false;
    }

    bool Parser::expect(syntax::TokenKind k, std::string_view what) {
        if (aborted_) return false;

        if (cursor_.eat(k)) return true;
        if (stop_on_lex_error()) return false;

        const Token& got = cursor_.peek();
        if (got.kind == syntax::TokenKind::kEof) {
            report(diag::Code::kUnexpectedEof, got.span, what);
            return false;
        }

        report(diag::Code::kExpectedToken, got.span, what, got.lexeme);
        return false;
    }

    std::string_view Parser::text_between(size_t first_tok, size_t last_tok) const {
        // 모든 lexeme은 같은 소스 버퍼를 가리킨다
        const Token& a = cursor_.at_index(first_tok);
        const Token& b = cursor_.at_index(last_tok);
        if (b.span.hi <= a.span.lo) return a.lexeme;
        return std::string_view(a.lexeme.data(), b.span.hi - a.span.lo);
    }

    term::TermPtr Parser::parse_program() {
        if (aborted_) return nullptr;

        BindingContext root;
        auto t = parse_term(root);
        if (!t) return nullptr;

        if (!cursor_.at(syntax::TokenKind::kEof)) {
            if (stop_on_lex_error()) return nullptr;
            const Token& extra = cursor_.peek();
            report(diag::Code::kTrailingInput, extra.span, extra.lexeme);
            return nullptr;
        }
        return t;
    }

    term::TermPtr Parser::parse_term(const BindingContext& ctx) {
        using K = syntax::TokenKind;
        if (aborted_) return nullptr;

        const Token& tok = cursor_.peek();
        switch (tok.kind) {
            case K::kIdent:
                return parse_variable(ctx);

            case K::kLParen: {
                const Token lp = cursor_.bump();
                if (cursor_.eat(K::kLambda)) return parse_abstraction(lp, ctx);
                return parse_application(lp, ctx);
            }

            case K::kEof:
                report(diag::Code::kUnexpectedEof, tok.span, "a term");
                return nullptr;

            case K::kError:
                aborted_ = true;
                return nullptr;

            default:
                report(diag::Code::kUnexpectedToken, tok.span, tok.lexeme);
                return nullptr;
        }
    }

    term::TermPtr Parser::parse_variable(const BindingContext& ctx) {
        const Token name = cursor_.bump();

        auto idx = ctx.lookup(name.lexeme);
        if (!idx) {
            report(diag::Code::kUnboundVariable, name.span, name.lexeme);
            return nullptr;
        }
        return term::make_variable(*idx, name.span);
    }

    term::TermPtr Parser::parse_abstraction(const Token& lparen, const BindingContext& ctx) {
        using K = syntax::TokenKind;

        // binder
        const Token& name_tok = cursor_.peek();
        if (name_tok.kind != K::kIdent) {
            if (stop_on_lex_error()) return nullptr;
            if (name_tok.kind == K::kEof) {
                report(diag::Code::kUnexpectedEof, name_tok.span, "a binder name");
            } else {
                report(diag::Code::kBinderNameExpected, name_tok.span, name_tok.lexeme);
            }
            return nullptr;
        }
        const Token name = cursor_.bump();

        // head: '.' | ':' type '.' | (nothing)
        ty::TypeId arg_ty = ty::kInvalidType;
        if (cursor_.eat(K::kColon)) {
            auto pt = parse_type();
            if (aborted_) return nullptr;
            arg_ty = pt.id;
            if (!expect(K::kDot, "'.'")) return nullptr;
        } else {
            cursor_.eat(K::kDot);
        }

        auto body = parse_term(ctx.extended(name.lexeme));
        if (!body) return nullptr;

        const Token rp = cursor_.peek();
        if (!expect(K::kRParen, "')'")) return nullptr;

        return term::make_abstraction(std::move(body), arg_ty, join(lparen.span, rp.span));
    }

    term::TermPtr Parser::parse_application(const Token& lparen, const BindingContext& ctx) {
        using K = syntax::TokenKind;

        const size_t first_tok = cursor_.pos();

        // function과 argument는 모두 같은 ctx에서 시작한다
        auto fn = parse_term(ctx);
        if (!fn) return nullptr;

        if (cursor_.at(K::kRParen)) {
            const Token& rp = cursor_.peek();
            const size_t last_tok = cursor_.pos() - 1;
            report(diag::Code::kApplicationNeedsArgument,
                   join(lparen.span, rp.span),
                   text_between(first_tok, last_tok));
            return nullptr;
        }

        term::TermPtr acc = std::move(fn);
        while (!cursor_.at(K::kRParen) && !cursor_.at(K::kEof)) {
            auto arg = parse_term(ctx);
            if (!arg) return nullptr;

            const Span sp = join(lparen.span, arg->span);
            acc = term::make_application(std::move(acc), std::move(arg), sp);
        }

        const Token rp = cursor_.peek();
        if (!expect(K::kRParen, "')'")) return nullptr;

        acc->span = join(lparen.span, rp.span);
        return acc;
    }

    Parser::ParsedType Parser::parse_type() {
        using K = syntax::TokenKind;

        auto lhs = parse_type_atom();
        if (aborted_) return lhs;

        if (!cursor_.eat(K::kArrow)) return lhs;

        auto rhs = parse_type();
        if (aborted_) return rhs;

        ParsedType out{};
        out.id = types_.make_fn(lhs.id, rhs.id);
        out.span = join(lhs.span, rhs.span);
        return out;
    }

    Parser::ParsedType Parser::parse_type_atom() {
        using K = syntax::TokenKind;

        const Token& s = cursor_.peek();

        // ---- Ident ----
        if (s.kind == K::kIdent) {
            const Token name = cursor_.bump();
            ParsedType out{};
            out.id = types_.make_base(name.lexeme);
            out.span = name.span;
            return out;
        }

        // ---- ( type ) ----
        if (s.kind == K::kLParen) {
            const Token lp = cursor_.bump();
            auto inner = parse_type();
            if (aborted_) return inner;

            const Token rp = cursor_.peek();
            if (!expect(K::kRParen, "')'")) return inner;

            ParsedType out{};
            out.id = inner.id;
            out.span = join(lp.span, rp.span);
            return out;
        }

        // ---- error ----
        ParsedType out{};
        out.id = types_.error();
        out.span = s.span;

        if (stop_on_lex_error()) return out;
        if (s.kind == K::kEof) {
            report(diag::Code::kUnexpectedEof, s.span, "a type");
        } else {
            report(diag::Code::kTypeExpected, s.span, s.lexeme);
        }
        return out;
    }

    term::TermPtr parse_source(std::string_view text, uint32_t file_id, ty::TypePool& types, diag::Bag& bag) {
        Lexer lex(text, file_id, &bag);
        const auto tokens = lex.lex_all();

        Parser p(tokens, types, &bag);
        return p.parse_program();
    }

} // namespace lcalc
