// include/lcalc/ty/TypePool.hpp
#pragma once
#include <lcalc/ty/Type.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace lcalc::ty {

    /// @brief 모든 타입을 intern 한다. 구조가 같은 타입은 항상 같은 TypeId를 갖는다.
    class TypePool {
    public:
        TypePool() {
            types_.reserve(64);

            // [0] canonical error type
            Type err{};
            err.kind = Kind::kError;
            types_.push_back(err);
            error_id_ = 0;
        }

        TypeId error() const {  return error_id_;  }

        const Type& get(TypeId id) const {  return types_[id];  }

        uint32_t count() const {  return (uint32_t)types_.size();  }

        bool valid(TypeId id) const {
            return id != kInvalidType && id < types_.size();
        }

        // ---- base type interning ----
        TypeId make_base(std::string_view name) {
            for (TypeId i = 0; i < (TypeId)types_.size(); ++i) {
                const auto& t = types_[i];
                if (t.kind == Kind::kBase && names_[t.name_index] == name) return i;
            }

            Type t{};
            t.kind = Kind::kBase;
            t.name_index = (uint32_t)names_.size();
            names_.emplace_back(name);
            return push_(t);
        }

        // ---- function type interning ----
        TypeId make_fn(TypeId param, TypeId ret) {
            // linear search v0 (ok)
            for (TypeId i = 0; i < (TypeId)types_.size(); ++i) {
                const auto& t = types_[i];
                if (t.kind == Kind::kFn && t.param == param && t.ret == ret) return i;
            }

            Type t{};
            t.kind = Kind::kFn;
            t.param = param;
            t.ret = ret;
            return push_(t);
        }

        bool is_fn(TypeId id) const {
            return valid(id) && types_[id].kind == Kind::kFn;
        }

        TypeId fn_param(TypeId fn) const {
            if (!is_fn(fn)) return error();
            return types_[fn].param;
        }

        TypeId fn_ret(TypeId fn) const {
            if (!is_fn(fn)) return error();
            return types_[fn].ret;
        }

        /// @brief kBase의 이름. 다른 kind는 빈 문자열.
        std::string_view base_name(TypeId id) const {
            if (!valid(id) || types_[id].kind != Kind::kBase) return {};
            return names_[types_[id].name_index];
        }

        // --------------------
        // Debug helpers
        // --------------------

        /// @brief 사람이 읽는 형태: A, (A)→B
        std::string to_string(TypeId id) const;

    private:
        TypeId push_(const Type& t) {
            types_.push_back(t);
            return (TypeId)(types_.size() - 1);
        }

        std::vector<Type> types_;
        std::vector<std::string> names_;
        TypeId error_id_ = 0;
    };

} // namespace lcalc::ty
