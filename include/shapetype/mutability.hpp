#ifndef SHAPETYPE_MUTABILITY_HPP
#define SHAPETYPE_MUTABILITY_HPP

#include <shapetype/equal.hpp>
#include <shapetype/shape.hpp>

namespace shapetype {

// Mutable<S>: every member of S with its read-only modifier removed. Value
// types and optionality are untouched.
template <std::size_t Cap>
consteval TypeExpr<Cap> mutable_projection(const TypeExpr<Cap>& shape) {
    detail::require_object(shape);
    auto result = extract(shape.ast, shape.id);
    const auto& n = result.node();
    for (int i = 0; i < n.child_count; ++i)
        result.ast.nodes[n.children[i]].flags &=
            ~static_cast<unsigned>(Modifier::ReadOnly);
    return result;
}

// A member is writable iff its single-member slice is identical to the same
// slice of the mutable projection.
template <std::size_t Cap>
consteval bool is_writable(const TypeExpr<Cap>& shape, const char* key) {
    return types_equal(slice(shape, key),
                       slice(mutable_projection(shape), key));
}

template <std::size_t Cap>
consteval bool is_readonly(const TypeExpr<Cap>& shape, const char* key) {
    return !is_writable(shape, key);
}

} // namespace shapetype

#endif // SHAPETYPE_MUTABILITY_HPP
