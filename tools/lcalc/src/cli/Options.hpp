// tools/lcalc/src/cli/Options.hpp
#pragma once

#include <lcalc/print/Printer.hpp>
#include <lcalc/reduce/Reduce.hpp>

#include <cstdint>
#include <ostream>
#include <string>


namespace lcalc::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kRun,
    };

    struct Options {
        Mode mode = Mode::kUsage;

        std::string term_path{};
        std::string arg_path{};     // --arg, 비어 있으면 적용하지 않음

        print::Style style = print::Style::kNamed;
        reduce::Strategy strategy = reduce::Strategy::kWeakHead;

        uint64_t max_steps = 1000000;   // 0 = unlimited
        uint64_t max_nodes = 0;         // 0 = unlimited

        bool type_check = true;
        bool trace = false;
        bool verbose = false;
        bool dump_tokens = false;

        uint32_t context_lines = 2;

        bool ok = true;
        std::string error{};
    };

    /// @brief `lcalc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace lcalc::cli
