#ifndef SHAPETYPE_TYPE_EXPR_HPP
#define SHAPETYPE_TYPE_EXPR_HPP

#include <concepts>

#include <shapetype/ast.hpp>

namespace shapetype {

// A type description: the node at `id` of a flat AST. Every constructor
// returns a compact expression (only the nodes reachable from the root).
template <std::size_t Cap = 64> struct TypeExpr {
    TypeAST<Cap> ast{};
    int id{-1};

    constexpr const TypeNode& node() const { return ast.nodes[id]; }
    constexpr const char* tag() const { return ast.nodes[id].tag; }
    consteval int child_count() const { return ast.nodes[id].child_count; }
    consteval bool is(const char* t) const { return str_eq(tag(), t); }
    consteval TypeExpr child(int i) const;
};

// --- Subtree extraction ---

template <std::size_t Cap>
consteval TypeExpr<Cap> extract(const TypeAST<Cap>& ast, int id) {
    TypeExpr<Cap> result;
    result.id = detail::copy_subtree(result.ast, ast, id);
    return result;
}

template <std::size_t Cap>
consteval TypeExpr<Cap> TypeExpr<Cap>::child(int i) const {
    return extract(ast, ast.nodes[id].children[i]);
}

// Re-home an expression into a different capacity.
template <std::size_t To, std::size_t From>
consteval TypeExpr<To> resize(const TypeExpr<From>& e) {
    TypeExpr<To> result;
    result.id = detail::copy_subtree(result.ast, e.ast, e.id);
    return result;
}

// --- Generic node construction ---

// Nullary (leaf)
template <std::size_t Cap = 64>
consteval TypeExpr<Cap> make_leaf(const char* tag, const char* name = "") {
    TypeExpr<Cap> result;
    result.id = result.ast.add_node(node_header(tag, name));
    return result;
}

// N-ary (1-16 children) from standalone expressions
template <std::size_t Cap, std::same_as<TypeExpr<Cap>>... Rest>
    requires(sizeof...(Rest) < MaxChildren)
consteval TypeExpr<Cap> make_node(TypeNode header, const TypeExpr<Cap>& c0,
                                  const Rest&... rest) {
    TypeExpr<Cap> result;
    int ids[1 + sizeof...(Rest)]{};
    ids[0] = detail::copy_subtree(result.ast, c0.ast, c0.id);
    [[maybe_unused]] std::size_t i = 1;
    ((ids[i++] = detail::copy_subtree(result.ast, rest.ast, rest.id)), ...);
    for (std::size_t k = 0; k < 1 + sizeof...(Rest); ++k)
        header.children[k] = ids[k];
    header.child_count = static_cast<int>(1 + sizeof...(Rest));
    result.id = result.ast.add_node(header);
    return result;
}

template <std::size_t Cap, std::same_as<TypeExpr<Cap>>... Rest>
    requires(sizeof...(Rest) < MaxChildren)
consteval TypeExpr<Cap> make_node(const char* tag, const TypeExpr<Cap>& c0,
                                  const Rest&... rest) {
    return make_node(node_header(tag), c0, rest...);
}

namespace detail {

// Build `header` over a selection of subtrees that all live in `src`.
template <std::size_t Cap>
consteval TypeExpr<Cap> assemble(TypeNode header, const TypeAST<Cap>& src,
                                 const int* ids, int n) {
    if (n > MaxChildren)
        throw "shape error: a node supports at most 16 children";
    TypeExpr<Cap> result;
    for (int i = 0; i < n; ++i)
        header.children[i] = copy_subtree(result.ast, src, ids[i]);
    header.child_count = n;
    result.id = result.ast.add_node(header);
    return result;
}

} // namespace detail

} // namespace shapetype

#endif // SHAPETYPE_TYPE_EXPR_HPP
