// src/reduce/substitute.cpp
#include <lcalc/reduce/Substitute.hpp>


namespace lcalc::reduce {

    using term::Term;
    using term::TermKind;
    using term::TermPtr;

    TermPtr substitute(const Term& t, uint64_t index, const Term& replacement) {
        switch (t.kind) {
            case TermKind::kVariable:
                if (t.idx == index) return term::clone(replacement);
                return term::make_variable(t.idx, t.span);

            case TermKind::kAbstraction:
                return term::make_abstraction(
                    substitute(*t.body, index + 1, replacement), t.argument_type, t.span);

            case TermKind::kApplication:
                return term::make_application(
                    substitute(*t.function, index, replacement),
                    substitute(*t.argument, index, replacement),
                    t.span);
        }
        return nullptr;
    }

    TermPtr shift(const Term& t, int64_t delta, uint64_t cutoff) {
        switch (t.kind) {
            case TermKind::kVariable: {
                if (t.idx < cutoff) return term::make_variable(t.idx, t.span);
                const int64_t moved = (int64_t)t.idx + delta;
                // free index가 cutoff 아래로 내려가면 다른 binder에 잡힌다
                if (moved < (int64_t)cutoff) return nullptr;
                return term::make_variable((uint64_t)moved, t.span);
            }

            case TermKind::kAbstraction: {
                auto body = shift(*t.body, delta, cutoff + 1);
                if (!body) return nullptr;
                return term::make_abstraction(std::move(body), t.argument_type, t.span);
            }

            case TermKind::kApplication: {
                auto f = shift(*t.function, delta, cutoff);
                if (!f) return nullptr;
                auto a = shift(*t.argument, delta, cutoff);
                if (!a) return nullptr;
                return term::make_application(std::move(f), std::move(a), t.span);
            }
        }
        return nullptr;
    }

    static TermPtr substitute_shifting_(const Term& t, uint64_t index, const Term& replacement, uint64_t depth) {
        switch (t.kind) {
            case TermKind::kVariable:
                if (t.idx == index) {
                    if (depth == 0) return term::clone(replacement);
                    return shift(replacement, (int64_t)depth, 0);
                }
                return term::make_variable(t.idx, t.span);

            case TermKind::kAbstraction:
                return term::make_abstraction(
                    substitute_shifting_(*t.body, index + 1, replacement, depth + 1), t.argument_type, t.span);

            case TermKind::kApplication:
                return term::make_application(
                    substitute_shifting_(*t.function, index, replacement, depth),
                    substitute_shifting_(*t.argument, index, replacement, depth),
                    t.span);
        }
        return nullptr;
    }

    TermPtr substitute_shifting(const Term& t, uint64_t index, const Term& replacement) {
        return substitute_shifting_(t, index, replacement, 0);
    }

    TermPtr contract(const Term& body, const Term& argument) {
        auto lifted = shift(argument, +1, 0);
        auto replaced = substitute_shifting(body, 0, *lifted);
        // index 0은 모두 치환됐으므로 남은 free index는 >= 1 이고 -1 shift는 실패하지 않는다
        return shift(*replaced, -1, 0);
    }

} // namespace lcalc::reduce
