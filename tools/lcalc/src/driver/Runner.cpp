// tools/lcalc/src/driver/Runner.cpp
#include "Runner.hpp"

#include <lcalc/diag/DiagCode.hpp>
#include <lcalc/diag/Diagnostic.hpp>
#include <lcalc/diag/Render.hpp>
#include <lcalc/lex/Lexer.hpp>
#include <lcalc/os/File.hpp>
#include <lcalc/parse/Parser.hpp>
#include <lcalc/print/Printer.hpp>
#include <lcalc/reduce/Reduce.hpp>
#include <lcalc/term/Term.hpp>
#include <lcalc/text/SourceManager.hpp>
#include <lcalc/ty/TypePool.hpp>
#include <lcalc/tyck/TypeCheck.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace lcalc::driver {

    namespace {

        /// @brief 진단을 컨텍스트 포함 형태로 stderr에 출력하고 종료 코드를 반환한다.
        int flush_diags(const diag::Bag& bag, const SourceManager& sm, uint32_t context_lines) {
            for (const auto& d : bag.diags()) {
                std::cerr << diag::render_one_context(d, sm, context_lines) << "\n";
            }
            return bag.has_error() ? 1 : 0;
        }

        void log(const cli::Options& opt, std::string_view phase, const std::string& msg) {
            if (!opt.verbose) return;
            std::cerr << "[lcalc] " << phase << ": " << msg << "\n";
        }

        /// @brief 파일 하나를 읽어 term으로 만든다. 실패하면 nullptr.
        /// 파일 오류는 out_error, 문법 오류는 bag에 남는다.
        term::TermPtr load_term(
            const std::string& path,
            const cli::Options& opt,
            SourceManager& sm,
            ty::TypePool& types,
            diag::Bag& bag,
            std::string& out_error
        ) {
            std::string content;
            if (!open_file(path, content, out_error)) return nullptr;

            const uint32_t file_id = sm.add(path, std::move(content));
            const std::string_view src = sm.content(file_id);

            Lexer lex(src, file_id, &bag);
            const auto tokens = lex.lex_all();

            if (opt.dump_tokens) {
                std::cout << "TOKENS (" << path << "):\n";
                print::dump_tokens(tokens, std::cout);
            }

            Parser p(tokens, types, &bag);
            auto t = p.parse_program();
            if (t) {
                log(opt, "parse", normalize_path(path) + " (" + std::to_string(term::node_count(*t)) +
                    " nodes, depth " + std::to_string(term::depth(*t)) + ")");
            }
            return t;
        }

        /// @brief 리덕션 결과 상태를 진단으로 바꾼다. 정상이면 false.
        bool report_reduce_status(const reduce::ReduceResult& rr, const cli::Options& opt,
                                  const ty::TypePool& types, diag::Bag& bag) {
            const Span none{k_no_file, 0, 0};

            switch (rr.status) {
                case reduce::ReduceStatus::kNormal:
                    return false;

                case reduce::ReduceStatus::kStepLimit: {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kReduceStepBudget, none);
                    d.add_arg_int(opt.max_steps);
                    bag.add(std::move(d));
                    return true;
                }

                case reduce::ReduceStatus::kSizeLimit: {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kReduceSizeBudget, none);
                    d.add_arg_int(opt.max_nodes);
                    bag.add(std::move(d));
                    return true;
                }

                case reduce::ReduceStatus::kStuck: {
                    const term::Term* head = rr.term.get();
                    while (head->is_application()) head = head->function.get();

                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kReduceStuck, none);
                    d.add_arg(print::render_term(*head, types, print::Style::kIndexed));
                    bag.add(std::move(d));
                    return true;
                }
            }
            return false;
        }

    } // namespace

    int run(const cli::Options& opt) {
        SourceManager sm;
        ty::TypePool types;
        diag::Bag bag;
        std::string file_err;

        // ---- load ----
        auto program = load_term(opt.term_path, opt, sm, types, bag, file_err);
        if (!file_err.empty()) {
            std::cerr << "error: " << file_err << "\n";
            return 1;
        }
        if (!program) return flush_diags(bag, sm, opt.context_lines);

        if (!opt.arg_path.empty()) {
            auto arg = load_term(opt.arg_path, opt, sm, types, bag, file_err);
            if (!file_err.empty()) {
                std::cerr << "error: " << file_err << "\n";
                return 1;
            }
            if (!arg) return flush_diags(bag, sm, opt.context_lines);

            const Span sp = program->span;
            program = term::make_application(std::move(program), std::move(arg), sp);
            log(opt, "apply", "argument from " + opt.arg_path);
        }

        // ---- type check (typed variant only, on the term before reduction) ----
        const bool typed = term::has_type_annotation(*program);
        log(opt, "variant", typed ? "typed" : "untyped");

        ty::TypeId program_ty = ty::kInvalidType;
        if (typed && opt.type_check) {
            tyck::TypeChecker tc(types, bag);
            const auto res = tc.check(*program);
            if (!res.ok) {
                log(opt, "type", tc.message(res.errors.front()));
                return flush_diags(bag, sm, opt.context_lines);
            }
            program_ty = res.type;
            log(opt, "type", print::render_type(program_ty, types));
        }

        // ---- reduce ----
        reduce::ReduceOptions ropt{};
        ropt.budget.max_steps = opt.max_steps;
        ropt.budget.max_nodes = opt.max_nodes;
        ropt.strategy = opt.strategy;
        if (opt.trace) {
            ropt.on_step = [&](uint64_t step, const term::Term& focus) {
                std::cerr << "[step " << step << "] " << print::render_term(focus, types, opt.style) << "\n";
            };
        }

        const auto rr = reduce::reduce(*program, ropt);
        log(opt, "reduce", "strategy=" + std::string(reduce::strategy_name(opt.strategy)) +
            " status=" + std::string(reduce::reduce_status_name(rr.status)) +
            " steps=" + std::to_string(rr.steps));

        if (report_reduce_status(rr, opt, types, bag)) {
            return flush_diags(bag, sm, opt.context_lines);
        }

        // ---- print ----
        // typed: (term):type, untyped: term
        const std::string shown = print::render_term(*rr.term, types, opt.style);
        if (program_ty != ty::kInvalidType) {
            std::cout << "(" << shown << "):" << print::render_type(program_ty, types, opt.style) << "\n";
        } else {
            std::cout << shown << "\n";
        }

        return flush_diags(bag, sm, opt.context_lines);
    }

} // namespace lcalc::driver
