// src/tyck/type_check.cpp
#include <lcalc/tyck/TypeCheck.hpp>
#include <lcalc/print/Printer.hpp>


namespace lcalc::tyck {

    TyckResult TypeChecker::check(const term::Term& t) {
        TyckResult out{};
        ctx_.clear();
        result_ = &out;

        out.type = check_(t);
        if (!out.ok) out.type = types_.error();

        result_ = nullptr;
        ctx_.clear();
        return out;
    }

    ty::TypeId TypeChecker::check_(const term::Term& t) {
        if (!result_->ok) return types_.error();

        switch (t.kind) {
            case term::TermKind::kVariable:    return check_variable_(t);
            case term::TermKind::kAbstraction: return check_abstraction_(t);
            case term::TermKind::kApplication: return check_application_(t);
        }
        return types_.error();
    }

    ty::TypeId TypeChecker::check_variable_(const term::Term& t) {
        if (t.idx >= ctx_.size()) {
            TyError e{};
            e.kind = TyErrorKind::kUnboundIndex;
            e.span = t.span;
            e.binders = ctx_.size();
            e.index = t.idx;
            fail_(std::move(e));
            return types_.error();
        }
        return ctx_[ctx_.size() - 1 - t.idx];
    }

    ty::TypeId TypeChecker::check_abstraction_(const term::Term& t) {
        if (t.argument_type == ty::kInvalidType) {
            TyError e{};
            e.kind = TyErrorKind::kAnnotationRequired;
            e.span = t.span;
            e.binders = ctx_.size();
            fail_(std::move(e));
            return types_.error();
        }

        ctx_.push_back(t.argument_type);
        const ty::TypeId body_ty = check_(*t.body);
        ctx_.pop_back();

        if (!result_->ok) return types_.error();

        return types_.make_fn(t.argument_type, body_ty);
    }

    ty::TypeId TypeChecker::check_application_(const term::Term& t) {
        // function과 argument는 같은 context에서 독립적으로 검사한다
        const ty::TypeId fn_ty = check_(*t.function);
        if (!result_->ok) return types_.error();

        const ty::TypeId arg_ty = check_(*t.argument);
        if (!result_->ok) return types_.error();

        if (types_.is_fn(fn_ty) && types_.fn_param(fn_ty) == arg_ty) {
            return types_.fn_ret(fn_ty);
        }

        TyError e{};
        e.kind = TyErrorKind::kInvalidApplication;
        e.span = t.span;
        e.binders = ctx_.size();
        e.function = term::clone(*t.function);
        e.function_type = fn_ty;
        e.argument = term::clone(*t.argument);
        e.argument_type = arg_ty;
        fail_(std::move(e));
        return types_.error();
    }

    void TypeChecker::fail_(TyError e) {
        result_->ok = false;

        if (diag_bag_) {
            switch (e.kind) {
                case TyErrorKind::kInvalidApplication: {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kTypeInvalidApplication, e.span);
                    d.add_arg(print::render_term(*e.function, types_, print::Style::kNamed, e.binders));
                    d.add_arg(print::render_type(e.function_type, types_));
                    d.add_arg(print::render_term(*e.argument, types_, print::Style::kNamed, e.binders));
                    d.add_arg(print::render_type(e.argument_type, types_));
                    diag_bag_->add(std::move(d));
                    break;
                }
                case TyErrorKind::kAnnotationRequired: {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kTypeAnnotationRequired, e.span);
                    diag_bag_->add(std::move(d));
                    break;
                }
                case TyErrorKind::kUnboundIndex: {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kTypeUnboundIndex, e.span);
                    d.add_arg_int(e.index);
                    d.add_arg_int(e.binders);
                    diag_bag_->add(std::move(d));
                    break;
                }
            }
        }

        result_->errors.push_back(std::move(e));
    }

    std::string TypeChecker::message(const TyError& e) const {
        switch (e.kind) {
            case TyErrorKind::kInvalidApplication:
                return "attempted to apply term (" +
                       print::render_term(*e.function, types_, print::Style::kNamed, e.binders) + "):" +
                       print::render_type(e.function_type, types_) + " to term (" +
                       print::render_term(*e.argument, types_, print::Style::kNamed, e.binders) + "):" +
                       print::render_type(e.argument_type, types_);
            case TyErrorKind::kAnnotationRequired:
                return "binder has no type annotation";
            case TyErrorKind::kUnboundIndex:
                return "variable index " + std::to_string(e.index) +
                       " escapes a typing context of depth " + std::to_string(e.binders);
        }
        return "type error";
    }

} // namespace lcalc::tyck
