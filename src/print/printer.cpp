// src/print/printer.cpp
#include <lcalc/print/Printer.hpp>
#include <lcalc/syntax/TokenKind.hpp>

#include <algorithm>
#include <vector>


namespace lcalc::print {

    std::string binder_name(uint64_t depth) {
        // base-26, letters only: a..z, ba..bz, ca..
        std::string s;
        do {
            s.push_back((char)('a' + (depth % 26)));
            depth /= 26;
        } while (depth != 0);
        std::reverse(s.begin(), s.end());
        return s;
    }

    // --------------------
    // types
    // --------------------

    static void type_debug_(ty::TypeId id, const ty::TypePool& types, std::string& out) {
        if (!types.valid(id)) { out += "Invalid"; return; }

        const ty::Type& t = types.get(id);
        switch (t.kind) {
            case ty::Kind::kError:
                out += "Error";
                return;
            case ty::Kind::kBase:
                out += "Base(";
                out += types.base_name(id);
                out += ")";
                return;
            case ty::Kind::kFn:
                out += "Function(";
                type_debug_(t.param, types, out);
                out += ", ";
                type_debug_(t.ret, types, out);
                out += ")";
                return;
        }
    }

    std::string render_type(ty::TypeId id, const ty::TypePool& types, Style style) {
        if (style == Style::kDebug) {
            std::string out;
            type_debug_(id, types, out);
            return out;
        }
        return types.to_string(id);
    }

    // --------------------
    // terms
    // --------------------

    namespace {

        class TermWriter {
        public:
            TermWriter(const ty::TypePool& types, Style style, uint64_t outer_binders)
                : types_(types), style_(style), outer_(outer_binders) {}

            std::string take() {  return std::move(out_);  }

            void write(const term::Term& t, uint64_t depth) {
                switch (style_) {
                    case Style::kNamed:   named_(t, depth); break;
                    case Style::kIndexed: indexed_(t); break;
                    case Style::kDebug:   debug_(t); break;
                }
            }

        private:
            // (f a b): left-nested application을 한 괄호로 펼친다
            template <typename Fn>
            void spine_(const term::Term& t, Fn&& each) {
                std::vector<const term::Term*> args;
                const term::Term* head = &t;
                while (head->is_application()) {
                    args.push_back(head->argument.get());
                    head = head->function.get();
                }

                out_ += "(";
                each(*head);
                for (size_t i = args.size(); i > 0; --i) {
                    out_ += " ";
                    each(*args[i - 1]);
                }
                out_ += ")";
            }

            void named_(const term::Term& t, uint64_t depth) {
                switch (t.kind) {
                    case term::TermKind::kVariable: {
                        const uint64_t level = outer_ + depth;
                        if (t.idx < level) {
                            out_ += binder_name(level - 1 - t.idx);
                        } else {
                            // free variable: 이름을 만들 binder가 없다
                            out_ += std::to_string(t.idx);
                        }
                        return;
                    }

                    case term::TermKind::kAbstraction:
                        out_ += "(λ";
                        out_ += binder_name(outer_ + depth);
                        if (t.argument_type != ty::kInvalidType) {
                            out_ += ":";
                            out_ += types_.to_string(t.argument_type);
                        }
                        out_ += ".";
                        named_(*t.body, depth + 1);
                        out_ += ")";
                        return;

                    case term::TermKind::kApplication:
                        spine_(t, [&](const term::Term& x) { named_(x, depth); });
                        return;
                }
            }

            void indexed_(const term::Term& t) {
                switch (t.kind) {
                    case term::TermKind::kVariable:
                        out_ += std::to_string(t.idx);
                        return;

                    case term::TermKind::kAbstraction:
                        out_ += "(λ";
                        if (t.argument_type != ty::kInvalidType) {
                            out_ += ":";
                            out_ += types_.to_string(t.argument_type);
                        }
                        out_ += " ";
                        indexed_(*t.body);
                        out_ += ")";
                        return;

                    case term::TermKind::kApplication:
                        spine_(t, [&](const term::Term& x) { indexed_(x); });
                        return;
                }
            }

            void debug_(const term::Term& t) {
                switch (t.kind) {
                    case term::TermKind::kVariable:
                        out_ += "Variable(";
                        out_ += std::to_string(t.idx);
                        out_ += ")";
                        return;

                    case term::TermKind::kAbstraction:
                        out_ += "Abstraction(";
                        if (t.argument_type != ty::kInvalidType) {
                            out_ += "type=";
                            type_debug_(t.argument_type, types_, out_);
                            out_ += ", ";
                        }
                        out_ += "body=";
                        debug_(*t.body);
                        out_ += ")";
                        return;

                    case term::TermKind::kApplication:
                        out_ += "Application(function=";
                        debug_(*t.function);
                        out_ += ", argument=";
                        debug_(*t.argument);
                        out_ += ")";
                        return;
                }
            }

            const ty::TypePool& types_;
            Style style_;
            uint64_t outer_ = 0;
            std::string out_;
        };

    } // namespace

    std::string render_term(const term::Term& t, const ty::TypePool& types, Style style, uint64_t outer_binders) {
        TermWriter w(types, style, outer_binders);
        w.write(t, 0);
        return w.take();
    }

    void dump_tokens(const std::vector<Token>& tokens, std::ostream& os) {
        for (const auto& t : tokens) {
            os << syntax::token_kind_name(t.kind)
               << " '" << t.lexeme << "'"
               << " [" << t.span.lo << "," << t.span.hi << ")\n";
        }
    }

} // namespace lcalc::print
