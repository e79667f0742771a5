// include/lcalc/term/Term.hpp
#pragma once
#include <lcalc/text/Span.hpp>
#include <lcalc/ty/Type.hpp>

#include <cstdint>
#include <memory>


namespace lcalc::term {

    enum class TermKind : uint8_t {
        kVariable,
        kAbstraction,
        kApplication,
    };

    struct Term;
    using TermPtr = std::unique_ptr<Term>;

    /// @brief lambda term. 각 자식은 부모가 단독 소유한다.
    /// - kVariable:    idx (de Bruijn, 0 = innermost binder)
    /// - kAbstraction: argument_type (없으면 kInvalidType), body
    /// - kApplication: function, argument
    struct Term {
        Term() = default;
        Term(const Term&) = delete;
        Term& operator=(const Term&) = delete;

        /// @brief 자식을 worklist로 옮겨 해제한다. 수십만 단계의 spine도 스택을 쓰지 않는다.
        ~Term();

        TermKind kind = TermKind::kVariable;
        Span span{};

        // kVariable
        uint64_t idx = 0;

        // kAbstraction
        ty::TypeId argument_type = ty::kInvalidType;
        TermPtr body;

        // kApplication
        TermPtr function;
        TermPtr argument;

        bool is_variable() const    {  return kind == TermKind::kVariable;     }
        bool is_abstraction() const {  return kind == TermKind::kAbstraction;  }
        bool is_application() const {  return kind == TermKind::kApplication;  }
    };

    TermPtr make_variable(uint64_t idx, Span span = {});
    TermPtr make_abstraction(TermPtr body, ty::TypeId argument_type = ty::kInvalidType, Span span = {});
    TermPtr make_application(TermPtr function, TermPtr argument, Span span = {});

    /// @brief deep copy (span 포함)
    TermPtr clone(const Term& t);

    /// @brief 구조적 동등성. span은 비교하지 않는다.
    bool equal(const Term& a, const Term& b);

    uint64_t node_count(const Term& t);
    uint64_t depth(const Term& t);

    /// @brief 모든 변수가 자신을 감싸는 binder를 가리키는가
    bool is_closed(const Term& t);

    /// @brief abstraction 중 하나라도 타입 주석을 가지면 typed variant
    bool has_type_annotation(const Term& t);

    /// @brief application spine의 길이: ((f a) b) -> 2
    uint32_t spine_length(const Term& t);

} // namespace lcalc::term
