#include <lcalc/lex/Lexer.hpp>
#include <lcalc/parse/Parser.hpp>
#include <lcalc/diag/Render.hpp>
#include <lcalc/print/Printer.hpp>
#include <lcalc/term/Term.hpp>
#include <lcalc/text/SourceManager.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using lcalc::term::TermKind;

    struct Parsed {
        lcalc::ty::TypePool types;
        lcalc::diag::Bag bag;
        lcalc::term::TermPtr term;
    };

    static Parsed parse(const std::string& src) {
        Parsed p{};
        p.term = lcalc::parse_source(src, /*file_id=*/0, p.types, p.bag);
        return p;
    }

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool read_text_file_(const std::filesystem::path& p, std::string& out) {
        std::ifstream ifs(p, std::ios::in | std::ios::binary);
        if (!ifs) return false;
        out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        return true;
    }

    static bool same_term_(const std::string& a, const std::string& b) {
        auto pa = parse(a);
        auto pb = parse(b);
        if (!pa.term || !pb.term) return false;
        return lcalc::term::equal(*pa.term, *pb.term);
    }

    // --------------------
    // lexer
    // --------------------

    static bool test_lex_lambda_and_arrow_spellings() {
        using K = lcalc::syntax::TokenKind;

        const std::string src = "λ \\ → -> ( ) . : abc";
        lcalc::diag::Bag bag;
        lcalc::Lexer lx(src, 0, &bag);
        const auto toks = lx.lex_all();

        const std::vector<K> want{
            K::kLambda, K::kLambda, K::kArrow, K::kArrow,
            K::kLParen, K::kRParen, K::kDot, K::kColon, K::kIdent, K::kEof
        };

        bool ok = true;
        ok &= require_(!bag.has_error(), "valid token stream must not emit diagnostics");
        ok &= require_(toks.size() == want.size(), "unexpected token count");
        if (!ok) return false;

        for (size_t i = 0; i < want.size(); ++i) {
            ok &= require_(toks[i].kind == want[i], "token kind mismatch");
        }
        ok &= require_(toks[0].lexeme == "λ", "lambda lexeme must cover both UTF-8 bytes");
        ok &= require_(toks[2].span.hi - toks[2].span.lo == 3, "unicode arrow spans three bytes");
        ok &= require_(toks[8].lexeme == "abc", "identifier lexeme mismatch");
        return ok;
    }

    static bool test_lex_identifier_stops_at_non_letter() {
        using K = lcalc::syntax::TokenKind;

        const std::string src = "(xy.z)";
        lcalc::Lexer lx(src, 0);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= require_(toks.size() == 6, "expected ( xy . z ) eof");
        if (!ok) return false;
        ok &= require_(toks[1].kind == K::kIdent && toks[1].lexeme == "xy", "multi-letter identifier");
        ok &= require_(toks[3].kind == K::kIdent && toks[3].lexeme == "z", "single-letter identifier");
        return ok;
    }

    static bool test_lex_invalid_utf8_is_fatal() {
        const std::string src = std::string("(λx.x)") + "\xFF";
        lcalc::diag::Bag bag;
        lcalc::Lexer lx(src, 0, &bag);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= require_(toks.size() == 1, "invalid UTF-8 must yield only EOF");
        ok &= require_(toks.back().kind == lcalc::syntax::TokenKind::kEof, "last token must be EOF");
        ok &= require_(bag.has_fatal(), "invalid UTF-8 must be fatal");

        const auto* d = bag.first_with(lcalc::diag::Code::kInvalidUtf8);
        ok &= require_(d != nullptr, "InvalidUtf8 diagnostic missing");
        if (!ok) return false;

        ok &= require_(d->args().size() == 2, "InvalidUtf8 carries offset and byte");
        ok &= require_(d->args()[0] == "7", "offset must point at the bad byte");
        ok &= require_(d->args()[1] == "FF", "byte must be rendered as hex");
        return ok;
    }

    static bool test_parser_stops_after_lexer_fatal() {
        auto p = parse("(λx.x) \xC0\x80");

        bool ok = true;
        ok &= require_(p.term == nullptr, "parse must fail on invalid UTF-8");
        ok &= require_(p.bag.diags().size() == 1, "parser must not add diagnostics after a lexer fatal");
        ok &= require_(p.bag.has_code(lcalc::diag::Code::kInvalidUtf8), "InvalidUtf8 must be preserved");
        return ok;
    }

    static bool test_unknown_character_reported_once() {
        auto p = parse("(λx.x) #");

        bool ok = true;
        ok &= require_(p.term == nullptr, "unknown character must fail the parse");
        ok &= require_(p.bag.has_code(lcalc::diag::Code::kUnknownCharacter), "UnknownCharacter missing");
        ok &= require_(p.bag.size() == 1, "parser must not pile a second error on a lexer error");

        const auto* d = p.bag.first_with(lcalc::diag::Code::kUnknownCharacter);
        if (d) ok &= require_(d->args()[0] == "#", "unknown character argument");
        return ok;
    }

    // --------------------
    // term building
    // --------------------

    static bool test_identity_resolves_to_index_zero() {
        auto p = parse("(λx.x)");

        bool ok = true;
        ok &= require_(p.term != nullptr, "identity must parse");
        if (!ok) return false;

        const auto& t = *p.term;
        ok &= require_(t.kind == TermKind::kAbstraction, "root must be an abstraction");
        ok &= require_(t.argument_type == lcalc::ty::kInvalidType, "untyped binder has no type");
        ok &= require_(t.body->kind == TermKind::kVariable && t.body->idx == 0, "body must be index 0");
        ok &= require_(t.span.lo == 0 && t.span.hi == 7, "abstraction span covers '(' to ')'");
        ok &= require_(t.body->span.lo == 5 && t.body->span.hi == 6, "variable span points at x");
        return ok;
    }

    static bool test_ascii_lambda_and_bare_head() {
        bool ok = true;
        ok &= require_(same_term_("(\\x.x)", "(λx.x)"), "backslash is a lambda");
        ok &= require_(same_term_("(λx x)", "(λx.x)"), "the dot after a binder is optional");
        ok &= require_(same_term_("( λx . ( x  x ) )", "(λx.(x x))"), "whitespace is insignificant");
        return ok;
    }

    static bool test_application_folds_left() {
        auto p = parse("(λf.(λa.(λb.(f a b))))");

        bool ok = true;
        ok &= require_(p.term != nullptr, "n-ary application must parse");
        if (!ok) return false;

        const auto& app = *p.term->body->body->body;
        ok &= require_(app.kind == TermKind::kApplication, "outer node must be an application");
        ok &= require_(app.argument->idx == 0, "outer argument is b");
        ok &= require_(app.function->kind == TermKind::kApplication, "function side must be (f a)");
        ok &= require_(app.function->function->idx == 2, "f is index 2");
        ok &= require_(app.function->argument->idx == 1, "a is index 1");

        ok &= require_(same_term_("(λf.(λa.(λb.(f a b))))", "(λf.(λa.(λb.((f a) b))))"),
                       "(f a b) must equal ((f a) b)");
        ok &= require_(!same_term_("(λf.(λa.(λb.(f a b))))", "(λf.(λa.(λb.(f (a b)))))"),
                       "(f a b) must differ from (f (a b))");
        return ok;
    }

    static bool test_shadowing_inner_binder_wins() {
        auto p = parse("(λx.(λx.x))");
        auto q = parse("(λx.(λy.x))");

        bool ok = true;
        ok &= require_(p.term && q.term, "both terms must parse");
        if (!ok) return false;

        ok &= require_(p.term->body->body->idx == 0, "shadowed x refers to the inner binder");
        ok &= require_(q.term->body->body->idx == 1, "outer x skips one binder");
        return ok;
    }

    static bool test_sibling_contexts_are_isolated() {
        // the binder of (λy.y) must not shift x in the argument position
        auto p = parse("(λx.((λy.y) x))");

        bool ok = true;
        ok &= require_(p.term != nullptr, "term must parse");
        if (!ok) return false;

        const auto& app = *p.term->body;
        ok &= require_(app.function->body->idx == 0, "y is index 0 inside its own lambda");
        ok &= require_(app.argument->kind == TermKind::kVariable, "argument must be a variable");
        ok &= require_(app.argument->idx == 0, "x in argument position is index 0, not 1");

        lcalc::BindingContext root;
        auto one = root.extended("x");
        auto two = one.extended("y");
        ok &= require_(one.depth() == 1 && two.depth() == 2, "extended() returns a deeper copy");
        ok &= require_(!root.lookup("x").has_value(), "extending must not touch the original context");
        ok &= require_(*two.lookup("x") == 1 && *two.lookup("y") == 0, "existing entries shift by one");
        return ok;
    }

    static bool test_typed_binders_and_arrow_associativity() {
        auto p = parse("(λf:A->B->C.f)");
        auto q = parse("(λf:(A→B)→C.f)");
        auto r = parse("(λf:(A)→B.f)");

        bool ok = true;
        ok &= require_(p.term && q.term && r.term, "typed terms must parse");
        if (!ok) return false;

        auto& ty = p.types;
        const auto A = ty.make_base("A");
        const auto B = ty.make_base("B");
        const auto C = ty.make_base("C");
        ok &= require_(p.term->argument_type == ty.make_fn(A, ty.make_fn(B, C)), "arrows associate to the right");

        auto& ty2 = q.types;
        const auto A2 = ty2.make_base("A");
        const auto B2 = ty2.make_base("B");
        const auto C2 = ty2.make_base("C");
        ok &= require_(q.term->argument_type == ty2.make_fn(ty2.make_fn(A2, B2), C2), "parentheses group the parameter");

        auto& ty3 = r.types;
        ok &= require_(r.term->argument_type == ty3.make_fn(ty3.make_base("A"), ty3.make_base("B")),
                       "a parenthesised base parameter is the same type");
        return ok;
    }

    // --------------------
    // syntax errors
    // --------------------

    static bool expect_error_(const std::string& src, lcalc::diag::Code code, const char* what) {
        auto p = parse(src);
        bool ok = true;
        ok &= require_(p.term == nullptr, what);
        ok &= require_(p.bag.has_code(code), what);
        ok &= require_(p.bag.size() == 1, "parser must stop at the first error");
        if (!ok) std::cerr << "    src: " << src << "\n";
        return ok;
    }

    static bool test_syntax_error_codes() {
        using C = lcalc::diag::Code;
        bool ok = true;
        ok &= expect_error_("(λx.x", C::kUnexpectedEof, "missing ')' is UnexpectedEof");
        ok &= expect_error_("(λx.x]", C::kUnknownCharacter, "']' is not part of the alphabet");
        ok &= expect_error_("(λx.(x x)", C::kUnexpectedEof, "unfinished body");
        ok &= expect_error_("(λx.x x)", C::kExpectedToken, "abstraction body is a single term");
        ok &= expect_error_("(λ.x)", C::kBinderNameExpected, "lambda without a binder");
        ok &= expect_error_("(λx.(x))", C::kApplicationNeedsArgument, "single term in parentheses");
        ok &= expect_error_("(λx.x) (λy.y)", C::kTrailingInput, "two top-level terms");
        ok &= expect_error_("(λx:.x)", C::kTypeExpected, "':' without a type");
        ok &= expect_error_("(λx:A x)", C::kExpectedToken, "typed head requires '.'");
        ok &= expect_error_("()", C::kUnexpectedToken, "empty parentheses");
        ok &= expect_error_("", C::kUnexpectedEof, "empty input");
        return ok;
    }

    static bool test_unbound_variable_span_and_argument() {
        auto p = parse("(λx.y)");

        bool ok = true;
        ok &= require_(p.term == nullptr, "free variable must be rejected");
        const auto* d = p.bag.first_with(lcalc::diag::Code::kUnboundVariable);
        ok &= require_(d != nullptr, "UnboundVariable missing");
        if (!ok) return false;

        ok &= require_(d->args().size() == 1 && d->args()[0] == "y", "diagnostic names the identifier");
        ok &= require_(d->span().lo == 5 && d->span().hi == 6, "span points at y");
        return ok;
    }

    static bool test_application_needs_argument_names_the_term() {
        auto p = parse("(λx.(x))");
        const auto* d = p.bag.first_with(lcalc::diag::Code::kApplicationNeedsArgument);

        bool ok = true;
        ok &= require_(d != nullptr, "ApplicationNeedsArgument missing");
        if (!ok) return false;
        ok &= require_(d->args()[0] == "x", "argument is the lone term's text");
        ok &= require_(lcalc::diag::render_message(*d) ==
                       "application needs at least one argument; '(x)' is not a term",
                       "message mismatch");
        return ok;
    }

    static bool test_render_context_points_at_error() {
        const std::string src = "(λx.\n  (x y))\n";
        lcalc::SourceManager sm;
        const uint32_t fid = sm.add("t.lc", src);

        lcalc::ty::TypePool types;
        lcalc::diag::Bag bag;
        auto t = lcalc::parse_source(sm.content(fid), fid, types, bag);

        bool ok = true;
        ok &= require_(t == nullptr, "unbound y must fail");
        ok &= require_(bag.diags().size() == 1, "exactly one diagnostic");
        if (!ok) return false;

        const std::string out = lcalc::diag::render_one_context(bag.diags()[0], sm, 2);
        ok &= require_(out.find("error[UnboundVariable]: unbound variable 'y'") != std::string::npos,
                       "header line mismatch");
        ok &= require_(out.find(" --> t.lc:2:6") != std::string::npos, "location must be line 2, column 6");
        ok &= require_(out.find("  (x y))") != std::string::npos, "source line must be shown");
        ok &= require_(out.find("  2 |   (x y))\n    |      ^\n") != std::string::npos,
                       "caret must sit under y");
        if (!ok) std::cerr << out;
        return ok;
    }

    static bool test_columns_count_code_points() {
        lcalc::SourceManager sm;
        const uint32_t fid = sm.add("c.lc", "(λx:A→A.(λy.q))\nz");

        // "(λx:A→A.(λy." is 12 code points, 16 bytes
        const auto lc = sm.line_col(fid, 16);
        const auto blk = sm.snippet(lcalc::Span{fid, 16, 17}, 0);
        const auto next = sm.line_col(fid, 20);

        bool ok = true;
        ok &= require_(lc.line == 1 && lc.col == 13, "λ and → take one column each");
        ok &= require_(blk.lines.size() == 1 && blk.caret_line_offset == 0, "no context lines requested");
        ok &= require_(blk.caret_cols_before == 12 && blk.caret_cols_len == 1, "caret under q");
        ok &= require_(next.line == 2 && next.col == 1, "line after the newline");
        ok &= require_(!sm.has(lcalc::k_no_file), "k_no_file is never a registered file");
        return ok;
    }

    // --------------------
    // printing
    // --------------------

    static bool test_render_styles() {
        using lcalc::print::Style;
        auto p = parse("(λx:A.x)");
        auto q = parse("(λx.(λy.(x y y)))");

        bool ok = true;
        ok &= require_(p.term && q.term, "terms must parse");
        if (!ok) return false;

        ok &= require_(lcalc::print::render_term(*p.term, p.types) == "(λa:A.a)", "named typed identity");
        ok &= require_(lcalc::print::render_term(*p.term, p.types, Style::kIndexed) == "(λ:A 0)", "indexed typed identity");
        ok &= require_(lcalc::print::render_term(*p.term, p.types, Style::kDebug) ==
                       "Abstraction(type=Base(A), body=Variable(0))", "debug typed identity");

        ok &= require_(lcalc::print::render_term(*q.term, q.types) == "(λa.(λb.(a b b)))", "applications are flattened");
        ok &= require_(lcalc::print::render_term(*q.term, q.types, Style::kIndexed) == "(λ (λ (1 0 0)))", "indexed form");

        auto& ty = p.types;
        const auto fn = ty.make_fn(ty.make_base("A"), ty.make_base("B"));
        ok &= require_(lcalc::print::render_type(fn, ty) == "(A)→B", "function type text");
        ok &= require_(lcalc::print::render_type(fn, ty, Style::kDebug) == "Function(Base(A), Base(B))", "function type debug");
        return ok;
    }

    static bool test_binder_names() {
        bool ok = true;
        ok &= require_(lcalc::print::binder_name(0) == "a", "depth 0");
        ok &= require_(lcalc::print::binder_name(25) == "z", "depth 25");
        ok &= require_(lcalc::print::binder_name(26) == "ba", "depth 26");
        ok &= require_(lcalc::print::binder_name(27) == "bb", "depth 27");
        ok &= require_(lcalc::print::binder_name(26 * 26) == "baa", "depth 676");
        return ok;
    }

    static bool test_named_rendering_round_trips() {
        std::vector<std::string> srcs{
            "(λx.x)",
            "(λx.(λy.(y x)))",
            "(λf.(λx.(f (f x))))",
            "(λx:(A)→B.(λy:A.(x y)))",
            "(λx:A->B->C.x)",
            "((λx.(x x)) (λx.(x x)))",
            "(λx.((λy.y) x (λz.(z x))))",
        };

        // deep nesting exercises multi-letter binder names
        std::string deep;
        for (int i = 0; i < 30; ++i) deep += "(λq" + std::string(1, (char)('a' + (i % 26))) + std::string(i / 26, 'z') + ".";
        deep += "qa";
        for (int i = 0; i < 30; ++i) deep += ")";
        srcs.push_back(deep);

        bool ok = true;
        for (const auto& s : srcs) {
            auto p = parse(s);
            ok &= require_(p.term != nullptr, "source must parse");
            if (!p.term) { std::cerr << "    src: " << s << "\n"; continue; }

            ok &= require_(lcalc::term::is_closed(*p.term), "parsed term must be closed");

            const std::string text = lcalc::print::render_term(*p.term, p.types);
            lcalc::diag::Bag bag;
            auto again = lcalc::parse_source(text, 0, p.types, bag);
            ok &= require_(again != nullptr, "rendered text must parse");
            if (again) ok &= require_(lcalc::term::equal(*p.term, *again), "round-trip must be structural identity");
            if (!again || !lcalc::term::equal(*p.term, *again)) std::cerr << "    text: " << text << "\n";
        }
        return ok;
    }

    // --------------------
    // case files
    // --------------------

    static bool test_file_cases_directory() {
#ifndef LCALC_TEST_CASE_DIR
        std::cerr << "  - LCALC_TEST_CASE_DIR is not defined\n";
        return false;
#else
        const std::filesystem::path case_dir{LCALC_TEST_CASE_DIR};
        bool ok = true;

        ok &= require_(std::filesystem::is_directory(case_dir), "case directory does not exist");
        if (!ok) return false;

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(case_dir)) {
            if (!entry.is_regular_file()) continue;
            if (entry.path().extension() == ".lc") files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        ok &= require_(files.size() >= 5, "at least 5 case files are required");

        for (const auto& f : files) {
            std::cout << "  [CASE] " << f.filename().string() << "\n";

            std::string src;
            if (!read_text_file_(f, src)) {
                ok &= require_(false, "failed to read case file");
                continue;
            }

            auto p = parse(src);
            const bool expect_error = f.filename().string().rfind("err_parse_", 0) == 0;
            if (expect_error) {
                ok &= require_(p.term == nullptr && p.bag.has_error(), "err_parse_ case must fail to parse");
            } else {
                ok &= require_(p.term != nullptr && !p.bag.has_error(), "case must parse cleanly");
            }
        }
        return ok;
#endif
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"lex_lambda_and_arrow_spellings", test_lex_lambda_and_arrow_spellings},
        {"lex_identifier_stops_at_non_letter", test_lex_identifier_stops_at_non_letter},
        {"lex_invalid_utf8_is_fatal", test_lex_invalid_utf8_is_fatal},
        {"parser_stops_after_lexer_fatal", test_parser_stops_after_lexer_fatal},
        {"unknown_character_reported_once", test_unknown_character_reported_once},
        {"identity_resolves_to_index_zero", test_identity_resolves_to_index_zero},
        {"ascii_lambda_and_bare_head", test_ascii_lambda_and_bare_head},
        {"application_folds_left", test_application_folds_left},
        {"shadowing_inner_binder_wins", test_shadowing_inner_binder_wins},
        {"sibling_contexts_are_isolated", test_sibling_contexts_are_isolated},
        {"typed_binders_and_arrow_associativity", test_typed_binders_and_arrow_associativity},
        {"syntax_error_codes", test_syntax_error_codes},
        {"unbound_variable_span_and_argument", test_unbound_variable_span_and_argument},
        {"application_needs_argument_names_the_term", test_application_needs_argument_names_the_term},
        {"render_context_points_at_error", test_render_context_points_at_error},
        {"columns_count_code_points", test_columns_count_code_points},
        {"render_styles", test_render_styles},
        {"binder_names", test_binder_names},
        {"named_rendering_round_trips", test_named_rendering_round_trips},
        {"file_cases_directory", test_file_cases_directory},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL TESTS PASSED\n";
    return 0;
}
