// src/term/term.cpp
#include <lcalc/term/Term.hpp>

#include <algorithm>
#include <vector>


namespace lcalc::term {

    Term::~Term() {
        std::vector<TermPtr> work;
        auto detach = [&work](TermPtr& child) {
            if (child) work.push_back(std::move(child));
        };

        detach(body);
        detach(function);
        detach(argument);

        while (!work.empty()) {
            TermPtr cur = std::move(work.back());
            work.pop_back();
            detach(cur->body);
            detach(cur->function);
            detach(cur->argument);
        } // cur은 자식 없이 해제된다
    }

    TermPtr make_variable(uint64_t idx, Span span) {
        auto t = std::make_unique<Term>();
        t->kind = TermKind::kVariable;
        t->span = span;
        t->idx = idx;
        return t;
    }

    TermPtr make_abstraction(TermPtr body, ty::TypeId argument_type, Span span) {
        auto t = std::make_unique<Term>();
        t->kind = TermKind::kAbstraction;
        t->span = span;
        t->argument_type = argument_type;
        t->body = std::move(body);
        return t;
    }

    TermPtr make_application(TermPtr function, TermPtr argument, Span span) {
        auto t = std::make_unique<Term>();
        t->kind = TermKind::kApplication;
        t->span = span;
        t->function = std::move(function);
        t->argument = std::move(argument);
        return t;
    }

    TermPtr clone(const Term& t) {
        switch (t.kind) {
            case TermKind::kVariable:
                return make_variable(t.idx, t.span);
            case TermKind::kAbstraction:
                return make_abstraction(clone(*t.body), t.argument_type, t.span);
            case TermKind::kApplication:
                return make_application(clone(*t.function), clone(*t.argument), t.span);
        }
        return nullptr;
    }

    bool equal(const Term& a, const Term& b) {
        // application spine는 깊어질 수 있으므로 왼쪽은 반복, 오른쪽만 재귀
        const Term* x = &a;
        const Term* y = &b;
        for (;;) {
            if (x->kind != y->kind) return false;

            switch (x->kind) {
                case TermKind::kVariable:
                    return x->idx == y->idx;

                case TermKind::kAbstraction:
                    if (x->argument_type != y->argument_type) return false;
                    x = x->body.get();
                    y = y->body.get();
                    continue;

                case TermKind::kApplication:
                    if (!equal(*x->argument, *y->argument)) return false;
                    x = x->function.get();
                    y = y->function.get();
                    continue;
            }
            return false;
        }
    }

    uint64_t node_count(const Term& t) {
        uint64_t n = 0;
        std::vector<const Term*> work;
        work.push_back(&t);
        while (!work.empty()) {
            const Term* cur = work.back();
            work.pop_back();
            ++n;
            switch (cur->kind) {
                case TermKind::kVariable: break;
                case TermKind::kAbstraction: work.push_back(cur->body.get()); break;
                case TermKind::kApplication:
                    work.push_back(cur->function.get());
                    work.push_back(cur->argument.get());
                    break;
            }
        }
        return n;
    }

    uint64_t depth(const Term& t) {
        switch (t.kind) {
            case TermKind::kVariable: return 1;
            case TermKind::kAbstraction: return 1 + depth(*t.body);
            case TermKind::kApplication:
                return 1 + std::max(depth(*t.function), depth(*t.argument));
        }
        return 1;
    }

    static bool is_closed_under_(const Term& t, uint64_t binders) {
        switch (t.kind) {
            case TermKind::kVariable: return t.idx < binders;
            case TermKind::kAbstraction: return is_closed_under_(*t.body, binders + 1);
            case TermKind::kApplication:
                return is_closed_under_(*t.function, binders) && is_closed_under_(*t.argument, binders);
        }
        return false;
    }

    bool is_closed(const Term& t) {
        return is_closed_under_(t, 0);
    }

    bool has_type_annotation(const Term& t) {
        switch (t.kind) {
            case TermKind::kVariable: return false;
            case TermKind::kAbstraction:
                return t.argument_type != ty::kInvalidType || has_type_annotation(*t.body);
            case TermKind::kApplication:
                return has_type_annotation(*t.function) || has_type_annotation(*t.argument);
        }
        return false;
    }

    uint32_t spine_length(const Term& t) {
        uint32_t n = 0;
        const Term* cur = &t;
        while (cur->kind == TermKind::kApplication) {
            ++n;
            cur = cur->function.get();
        }
        return n;
    }

} // namespace lcalc::term
