// include/lcalc/reduce/Substitute.hpp
#pragma once
#include <lcalc/term/Term.hpp>

#include <cstdint>


namespace lcalc::reduce {

    /// @brief idx == index 인 변수를 replacement의 복사본으로 바꾼다.
    /// binder 아래로 내려가면 index가 1 증가한다. replacement는 그대로 삽입된다
    /// (re-index 없음). closed replacement에 대해서만 capture-free 하다.
    term::TermPtr substitute(const term::Term& t, uint64_t index, const term::Term& replacement);

    /// @brief idx >= cutoff 인 변수에 delta를 더한다. binder 아래에서는 cutoff + 1.
    /// @return free index가 cutoff 아래로 내려가야 하면 nullptr (잘못된 음수 shift).
    term::TermPtr shift(const term::Term& t, int64_t delta, uint64_t cutoff = 0);

    /// @brief substitute와 같지만, 삽입 시점의 binder 깊이만큼 replacement를 shift 한다.
    term::TermPtr substitute_shifting(const term::Term& t, uint64_t index, const term::Term& replacement);

    /// @brief capture-avoiding beta contraction: (λ.body) arg -> body[0 := arg]
    term::TermPtr contract(const term::Term& body, const term::Term& argument);

} // namespace lcalc::reduce
