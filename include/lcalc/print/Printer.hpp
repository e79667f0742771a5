// include/lcalc/print/Printer.hpp
#pragma once
#include <lcalc/term/Term.hpp>
#include <lcalc/ty/TypePool.hpp>
#include <lcalc/lex/Token.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>


namespace lcalc::print {

    enum class Style : uint8_t {
        kNamed,     // (λa.(a a)), 다시 parse 가능
        kIndexed,   // (λ (0 0))
        kDebug,     // Abstraction(body=Application(...))
    };

    /// @brief binder 깊이 -> 이름: 0=a ... 25=z, 26=ba, 27=bb ...
    std::string binder_name(uint64_t depth);

    /// @param outer_binders t를 감싸고 있는 binder 수 (열린 subterm을 이름으로 출력할 때)
    std::string render_term(const term::Term& t, const ty::TypePool& types,
                            Style style = Style::kNamed, uint64_t outer_binders = 0);

    std::string render_type(ty::TypeId id, const ty::TypePool& types, Style style = Style::kNamed);

    void dump_tokens(const std::vector<Token>& tokens, std::ostream& os);

} // namespace lcalc::print
