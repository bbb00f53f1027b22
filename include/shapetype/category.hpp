#ifndef SHAPETYPE_CATEGORY_HPP
#define SHAPETYPE_CATEGORY_HPP

#include <shapetype/assign.hpp>
#include <shapetype/shape.hpp>
#include <shapetype/types.hpp>
#include <shapetype/union.hpp>

namespace shapetype {

// --- Exclude / NonIndefinable ---

// Exclude<T, U>: the alternatives of T that are not assignable to U.
template <std::size_t Cap>
consteval TypeExpr<Cap> exclude(const TypeExpr<Cap>& t,
                                const TypeExpr<Cap>& u) {
    int ids[MaxChildren]{};
    int n = 0;
    if (t.is("union")) {
        const auto& node = t.node();
        for (int i = 0; i < node.child_count; ++i)
            if (!detail::assignable(t.ast, node.children[i], u.ast, u.id))
                ids[n++] = node.children[i];
    } else if (!t.is("never") && !is_assignable(t, u)) {
        ids[n++] = t.id;
    }
    return detail::union_of(t.ast, ids, n);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> non_indefinable(const TypeExpr<Cap>& t) {
    return exclude(t, tundefined<Cap>());
}

// --- Callable category ---

// `never` has no values to call, so it is not counted as callable.
template <std::size_t Cap>
consteval bool is_callable(const TypeExpr<Cap>& t) {
    return !t.is("never") && is_assignable(t, tfunction<Cap>());
}

// The undefined that optionality contributes is stripped first, so an
// optional method still counts as function-valued.
template <std::size_t Cap>
consteval bool is_function_valued(const TypeExpr<Cap>& shape,
                                  const char* key) {
    return is_callable(non_indefinable(property_type(shape, key)));
}

template <std::size_t Cap, std::size_t CapT>
consteval bool matches_category(const TypeExpr<Cap>& shape, const char* key,
                                const TypeExpr<CapT>& target) {
    return is_assignable(property_type(shape, key), target);
}

} // namespace shapetype

#endif // SHAPETYPE_CATEGORY_HPP
