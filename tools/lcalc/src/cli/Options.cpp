// tools/lcalc/src/cli/Options.cpp
#include "Options.hpp"

#include <charconv>
#include <string_view>
#include <vector>

namespace lcalc::cli {

    namespace {

        /// @brief 음이 아닌 10진 정수를 파싱한다.
        bool parse_u64(std::string_view s, uint64_t& out) {
            if (s.empty()) return false;
            const char* b = s.data();
            const char* e = s.data() + s.size();
            auto [p, ec] = std::from_chars(b, e, out);
            return ec == std::errc{} && p == e;
        }

        /// @brief 값이 필요한 플래그의 다음 인자를 꺼낸다.
        bool take_value(const std::vector<std::string_view>& args, size_t& i, std::string_view flag,
                        std::string_view& out, Options& opt) {
            if (i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = std::string(flag) + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        }

        bool take_number(const std::vector<std::string_view>& args, size_t& i, std::string_view flag,
                         uint64_t& out, Options& opt) {
            std::string_view v;
            if (!take_value(args, i, flag, v, opt)) return false;
            if (!parse_u64(v, out)) {
                opt.ok = false;
                opt.error = std::string(flag) + " expects a non-negative integer, got '" + std::string(v) + "'";
                return false;
            }
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "lcalc <file> [options]\n"
            << "  --version\n"
            << "  --help\n"
            << "\n"
            << "Options:\n"
            << "  -a, --arg <file>        apply the term to the term in <file>\n"
            << "  -d, --debug             print the structural form\n"
            << "  --indices               print de Bruijn indices instead of names\n"
            << "  --strategy whnf|full    weak head (default) or full normal form\n"
            << "  --max-steps N           reduction step budget (default 1000000, 0 = unlimited)\n"
            << "  --max-nodes N           term size budget (default 0 = unlimited)\n"
            << "  --no-check              skip type checking of typed terms\n"
            << "  --trace                 log every reduction step to stderr\n"
            << "  --verbose               log pipeline phases to stderr\n"
            << "  --dump-tokens           print the token stream of each input\n"
            << "  --context N             source lines around each diagnostic (default 2)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        std::vector<std::string_view> args;
        args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") { opt.mode = Mode::kVersion; return opt; }
            if (a == "--help" || a == "-h") { opt.mode = Mode::kUsage; return opt; }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string_view a = args[i];

            if (a == "-a" || a == "--arg") {
                std::string_view v;
                if (!take_value(args, i, a, v, opt)) return opt;
                opt.arg_path = std::string(v);
            } else if (a == "-d" || a == "--debug") {
                opt.style = print::Style::kDebug;
            } else if (a == "--indices") {
                opt.style = print::Style::kIndexed;
            } else if (a == "--strategy") {
                std::string_view v;
                if (!take_value(args, i, a, v, opt)) return opt;
                if (v == "whnf") opt.strategy = reduce::Strategy::kWeakHead;
                else if (v == "full") opt.strategy = reduce::Strategy::kNormalForm;
                else {
                    opt.ok = false;
                    opt.error = "unknown strategy '" + std::string(v) + "' (expected whnf or full)";
                    return opt;
                }
            } else if (a == "--max-steps") {
                if (!take_number(args, i, a, opt.max_steps, opt)) return opt;
            } else if (a == "--max-nodes") {
                if (!take_number(args, i, a, opt.max_nodes, opt)) return opt;
            } else if (a == "--context") {
                uint64_t n = 0;
                if (!take_number(args, i, a, n, opt)) return opt;
                opt.context_lines = static_cast<uint32_t>(n > 64 ? 64 : n);
            } else if (a == "--no-check") {
                opt.type_check = false;
            } else if (a == "--trace") {
                opt.trace = true;
            } else if (a == "--verbose") {
                opt.verbose = true;
            } else if (a == "--dump-tokens") {
                opt.dump_tokens = true;
            } else if (a.size() > 1 && a[0] == '-') {
                opt.ok = false;
                opt.error = "unknown option '" + std::string(a) + "'";
                return opt;
            } else {
                if (!opt.term_path.empty()) {
                    opt.ok = false;
                    opt.error = "unexpected extra input '" + std::string(a) + "'";
                    return opt;
                }
                opt.term_path = std::string(a);
            }
        }

        if (opt.term_path.empty()) {
            opt.ok = false;
            opt.error = "missing input file";
            return opt;
        }

        opt.mode = Mode::kRun;
        return opt;
    }

} // namespace lcalc::cli
