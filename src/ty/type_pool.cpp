// src/ty/type_pool.cpp
#include <lcalc/ty/TypePool.hpp>


namespace lcalc::ty {

    std::string TypePool::to_string(TypeId id) const {
        if (!valid(id)) return "<invalid>";

        const Type& t = types_[id];
        switch (t.kind) {
            case Kind::kError:
                return "<error>";

            case Kind::kBase:
                return names_[t.name_index];

            case Kind::kFn: {
                // parameter is always parenthesised so the text parses back
                std::string s = "(";
                s += to_string(t.param);
                s += ")→";
                s += to_string(t.ret);
                return s;
            }
        }
        return "<unknown>";
    }

} // namespace lcalc::ty
