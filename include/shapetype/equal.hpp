#ifndef SHAPETYPE_EQUAL_HPP
#define SHAPETYPE_EQUAL_HPP

#include <shapetype/str_utils.hpp>
#include <shapetype/type_expr.hpp>

namespace shapetype {

// --- Structural equality ---
//
// Exact identity of two type descriptions: tags, names (keys and literal
// spellings), member modifiers and children all match. Object members and
// union alternatives are sets, so their order is ignored; every other node
// compares its children positionally.

namespace detail {

consteval bool unordered_children(const char* tag) {
    return str_eq(tag, "object") || str_eq(tag, "union");
}

template <std::size_t CapA, std::size_t CapB>
consteval bool nodes_equal(const TypeAST<CapA>& ast_a, int id_a,
                           const TypeAST<CapB>& ast_b, int id_b) {
    const auto& a = ast_a.nodes[id_a];
    const auto& b = ast_b.nodes[id_b];

    if (!str_eq(a.tag, b.tag)) return false;
    if (!str_eq(a.name, b.name)) return false;
    if (a.flags != b.flags) return false;
    if (a.child_count != b.child_count) return false;

    if (!unordered_children(a.tag)) {
        for (int i = 0; i < a.child_count; ++i)
            if (!nodes_equal(ast_a, a.children[i], ast_b, b.children[i]))
                return false;
        return true;
    }

    // Both sides are duplicate-free (unique keys, normalized unions), so a
    // one-to-one match exists iff every child of a finds an unused partner.
    bool used[MaxChildren]{};
    for (int i = 0; i < a.child_count; ++i) {
        bool matched = false;
        for (int j = 0; j < b.child_count && !matched; ++j) {
            if (!used[j] &&
                nodes_equal(ast_a, a.children[i], ast_b, b.children[j])) {
                used[j] = true;
                matched = true;
            }
        }
        if (!matched)
            return false;
    }
    return true;
}

} // namespace detail

template <std::size_t CapA, std::size_t CapB>
consteval bool types_equal(const TypeExpr<CapA>& a, const TypeExpr<CapB>& b) {
    return detail::nodes_equal(a.ast, a.id, b.ast, b.id);
}

} // namespace shapetype

#endif // SHAPETYPE_EQUAL_HPP
