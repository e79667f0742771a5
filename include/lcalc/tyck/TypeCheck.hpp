// include/lcalc/tyck/TypeCheck.hpp
#pragma once
#include <lcalc/term/Term.hpp>
#include <lcalc/ty/TypePool.hpp>
#include <lcalc/text/Span.hpp>
#include <lcalc/diag/Diagnostic.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace lcalc::tyck {

    enum class TyErrorKind : uint8_t {
        kInvalidApplication,
        kAnnotationRequired,
        kUnboundIndex,
    };

    struct TyError {
        TyErrorKind kind = TyErrorKind::kInvalidApplication;
        Span span{};

        // typing context depth at the failing node
        uint64_t binders = 0;

        // kInvalidApplication
        term::TermPtr function;
        ty::TypeId function_type = ty::kInvalidType;
        term::TermPtr argument;
        ty::TypeId argument_type = ty::kInvalidType;

        // kUnboundIndex
        uint64_t index = 0;
    };

    struct TyckResult {
        bool ok = true;
        ty::TypeId type = ty::kInvalidType;
        std::vector<TyError> errors;
    };

    class TypeChecker {
    public:
        explicit TypeChecker(ty::TypePool& types)
            : types_(types) {}

        TypeChecker(ty::TypePool& types, diag::Bag& bag)
            : types_(types), diag_bag_(&bag) {}

        /// @brief 빈 context에서 term의 타입을 계산한다. 첫 에러에서 멈춘다.
        TyckResult check(const term::Term& t);

        /// @brief "attempted to apply term (F):T to term (A):U" 형태의 평문 메시지
        std::string message(const TyError& e) const;

    private:
        ty::TypeId check_(const term::Term& t);
        ty::TypeId check_variable_(const term::Term& t);
        ty::TypeId check_abstraction_(const term::Term& t);
        ty::TypeId check_application_(const term::Term& t);

        void fail_(TyError e);

        ty::TypePool& types_;
        diag::Bag* diag_bag_ = nullptr;

        // innermost binder last
        std::vector<ty::TypeId> ctx_;
        TyckResult* result_ = nullptr;
    };

} // namespace lcalc::tyck
