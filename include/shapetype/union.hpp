#ifndef SHAPETYPE_UNION_HPP
#define SHAPETYPE_UNION_HPP

#include <concepts>

#include <shapetype/equal.hpp>
#include <shapetype/type_expr.hpp>
#include <shapetype/types.hpp>

namespace shapetype {

// --- Union normalization ---
//
// A union node always holds at least two distinct, non-union, non-never
// alternatives. `unknown` absorbs every other alternative.

namespace detail {

template <std::size_t Cap>
consteval void collect_alternatives(const TypeAST<Cap>& ast, int id, int* ids,
                                    int& n) {
    const auto& node = ast.nodes[id];
    if (str_eq(node.tag, "union")) {
        for (int i = 0; i < node.child_count; ++i)
            collect_alternatives(ast, node.children[i], ids, n);
        return;
    }
    if (str_eq(node.tag, "never"))
        return;
    for (int k = 0; k < n; ++k)
        if (nodes_equal(ast, ids[k], ast, id))
            return;
    if (n >= MaxChildren)
        throw "shape error: a union supports at most 16 alternatives";
    ids[n++] = id;
}

template <std::size_t Cap>
consteval TypeExpr<Cap> union_of(const TypeAST<Cap>& ast, const int* ids,
                                 int n) {
    if (n == 0)
        return tnever<Cap>();
    if (n == 1)
        return extract(ast, ids[0]);
    return assemble(node_header("union"), ast, ids, n);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> normalize_union(const TypeExpr<Cap>& raw) {
    int ids[MaxChildren]{};
    int n = 0;
    collect_alternatives(raw.ast, raw.id, ids, n);
    for (int k = 0; k < n; ++k)
        if (str_eq(raw.ast.nodes[ids[k]].tag, "unknown"))
            return tunknown<Cap>();
    return union_of(raw.ast, ids, n);
}

} // namespace detail

// Union type: a | b | ...
template <std::size_t Cap, std::same_as<TypeExpr<Cap>>... Rest>
consteval TypeExpr<Cap> tunion(const TypeExpr<Cap>& a, const TypeExpr<Cap>& b,
                               const Rest&... rest) {
    return detail::normalize_union(make_node("union", a, b, rest...));
}

template <std::size_t Cap>
consteval int alternative_count(const TypeExpr<Cap>& t) {
    if (t.is("never"))
        return 0;
    return t.is("union") ? t.child_count() : 1;
}

} // namespace shapetype

#endif // SHAPETYPE_UNION_HPP
