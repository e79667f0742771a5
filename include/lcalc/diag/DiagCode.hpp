// include/lcalc/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace lcalc::diag {

    enum class Severity : uint8_t {
        kError,
        kFatal,   // 이후 단계가 입력을 믿을 수 없음 (invalid UTF-8)
    };

    enum class Code : uint16_t {
        kInvalidUtf8,   // input is not a valid UTF-8 string

        // ---- lexing ----
        kUnknownCharacter,        // character outside the term alphabet

        // ---- generic parse (SyntaxError) ----
        kExpectedToken,
        kUnexpectedToken,
        kUnexpectedEof,
        kTrailingInput,           // a complete term is followed by more tokens
        kBinderNameExpected,      // '(λ' must be followed by an identifier
        kApplicationNeedsArgument,// '(f)' : application needs at least two terms
        kTypeExpected,            // ':' in abstraction head must be followed by a type

        // ---- binding resolution (UnboundVariableError) ----
        kUnboundVariable,

        // =========================
        // tyck (TYPE CHECK)
        // =========================
        kTypeInvalidApplication,  // function/argument type mismatch
        kTypeAnnotationRequired,  // typed term contains an unannotated binder
        kTypeUnboundIndex,        // de Bruijn index escapes the typing context

        // ---- reduction budget ----
        kReduceStepBudget,
        kReduceSizeBudget,
        kReduceStuck,             // head variable applied to arguments (open term)
    };

} // namespace lcalc::diag
