// src/reduce/reduce.cpp
#include <lcalc/reduce/Reduce.hpp>
#include <lcalc/reduce/Substitute.hpp>

#include <vector>


namespace lcalc::reduce {

    using term::Term;
    using term::TermPtr;

    TermPtr beta_reduce(const Term& t) {
        if (!t.is_application()) return term::clone(t);

        auto f = beta_reduce(*t.function);
        if (f->is_abstraction()) {
            auto next = substitute(*f->body, 0, *t.argument);
            return beta_reduce(*next);
        }

        // stuck: head is a variable (closed input에서는 도달 불가)
        return term::make_application(std::move(f), term::clone(*t.argument), t.span);
    }

    namespace {

        // unwound application: head 에 적용될 인자 하나 + 원래 application의 span
        struct Frame {
            TermPtr arg;
            Span span{};
        };

        using Spine = std::vector<Frame>;

        TermPtr rebuild(TermPtr head, Spine& spine) {
            while (!spine.empty()) {
                Frame fr = std::move(spine.back());
                spine.pop_back();
                head = term::make_application(std::move(head), std::move(fr.arg), fr.span);
            }
            return head;
        }

        TermPtr rebuild_clone(const Term& head, const Spine& spine) {
            TermPtr out = term::clone(head);
            for (size_t i = spine.size(); i > 0; --i) {
                const Frame& fr = spine[i - 1];
                out = term::make_application(std::move(out), term::clone(*fr.arg), fr.span);
            }
            return out;
        }

        uint64_t spine_nodes(const Term& head, const Spine& spine) {
            uint64_t n = term::node_count(head);
            for (const auto& fr : spine) n += 1 + term::node_count(*fr.arg);
            return n;
        }

        class Engine {
        public:
            explicit Engine(const ReduceOptions& opt) : opt_(opt) {}

            ReduceStatus status() const {  return status_;  }
            uint64_t steps() const      {  return steps_;   }

            TermPtr run_weak_head(TermPtr t) {
                Spine spine;
                TermPtr head = whnf_(std::move(t), spine, /*capture_avoiding=*/false);

                if (status_ == ReduceStatus::kNormal && head->is_variable() && !spine.empty()) {
                    status_ = ReduceStatus::kStuck;
                }
                return rebuild(std::move(head), spine);
            }

            TermPtr run_normal_form(TermPtr t) {
                return nf_(std::move(t));
            }

        private:
            bool can_step_() {
                if (status_ != ReduceStatus::kNormal) return false;
                if (opt_.budget.max_steps != 0 && steps_ >= opt_.budget.max_steps) {
                    status_ = ReduceStatus::kStepLimit;
                    return false;
                }
                return true;
            }

            // spine을 풀어 head가 abstraction인 동안 contraction을 반복한다.
            // 반환 시 spine에는 아직 적용되지 않은 인자가 남는다 (back = 첫 번째 인자).
            TermPtr whnf_(TermPtr cur, Spine& spine, bool capture_avoiding) {
                for (;;) {
                    while (cur->is_application()) {
                        spine.push_back(Frame{std::move(cur->argument), cur->span});
                        TermPtr fn = std::move(cur->function);
                        cur = std::move(fn);
                    }

                    if (!cur->is_abstraction() || spine.empty()) return cur;
                    if (!can_step_()) return cur;

                    Frame fr = std::move(spine.back());
                    spine.pop_back();

                    cur = capture_avoiding ? contract(*cur->body, *fr.arg)
                                           : substitute(*cur->body, 0, *fr.arg);
                    ++steps_;

                    if (opt_.budget.max_nodes != 0 && spine_nodes(*cur, spine) > opt_.budget.max_nodes) {
                        status_ = ReduceStatus::kSizeLimit;
                        return cur;
                    }

                    if (opt_.on_step) {
                        auto view = rebuild_clone(*cur, spine);
                        opt_.on_step(steps_, *view);
                    }
                }
            }

            TermPtr nf_(TermPtr t) {
                Spine spine;
                TermPtr head = whnf_(std::move(t), spine, /*capture_avoiding=*/true);
                if (status_ != ReduceStatus::kNormal) return rebuild(std::move(head), spine);

                if (head->is_abstraction()) {
                    // whnf_가 멈췄으므로 spine은 비어 있다
                    head->body = nf_(std::move(head->body));
                    return head;
                }

                // head는 bound variable. 인자를 왼쪽부터 정규화한다.
                for (size_t i = spine.size(); i > 0; --i) {
                    if (status_ != ReduceStatus::kNormal) break;
                    spine[i - 1].arg = nf_(std::move(spine[i - 1].arg));
                }
                return rebuild(std::move(head), spine);
            }

            const ReduceOptions& opt_;
            ReduceStatus status_ = ReduceStatus::kNormal;
            uint64_t steps_ = 0;
        };

    } // namespace

    ReduceResult reduce(const Term& t, const ReduceOptions& opt) {
        Engine eng(opt);

        ReduceResult out{};
        switch (opt.strategy) {
            case Strategy::kWeakHead:
                out.term = eng.run_weak_head(term::clone(t));
                break;
            case Strategy::kNormalForm:
                out.term = eng.run_normal_form(term::clone(t));
                break;
        }
        out.status = eng.status();
        out.steps = eng.steps();
        return out;
    }

    std::string_view reduce_status_name(ReduceStatus s) {
        switch (s) {
            case ReduceStatus::kNormal: return "normal";
            case ReduceStatus::kStepLimit: return "step-limit";
            case ReduceStatus::kSizeLimit: return "size-limit";
            case ReduceStatus::kStuck: return "stuck";
        }
        return "unknown";
    }

    std::string_view strategy_name(Strategy s) {
        switch (s) {
            case Strategy::kWeakHead: return "whnf";
            case Strategy::kNormalForm: return "full";
        }
        return "unknown";
    }

} // namespace lcalc::reduce
