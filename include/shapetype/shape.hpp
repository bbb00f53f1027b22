#ifndef SHAPETYPE_SHAPE_HPP
#define SHAPETYPE_SHAPE_HPP

#include <concepts>

#include <shapetype/diagnostics.hpp>
#include <shapetype/key_set.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/type_expr.hpp>
#include <shapetype/types.hpp>
#include <shapetype/union.hpp>

namespace shapetype {

// --- Object shapes ---
//
// object(member...), member: name = key, flags = modifiers, [0] = declared
// value type. Keys are unique within a shape; member order carries no meaning.

template <std::size_t Cap = 64> struct Member {
    char key[MaxName]{};
    TypeExpr<Cap> type{};
    unsigned flags{0};
};

template <std::size_t Cap>
consteval Member<Cap> prop(const char* key, const TypeExpr<Cap>& type,
                           Modifier mods = Modifier::None) {
    if (str_len(key) == 0)
        throw "shape error: empty key";
    if (str_len(key) >= MaxName)
        throw "shape error: key too long (max 31 characters)";
    Member<Cap> m{};
    copy_str(m.key, key);
    m.type = type;
    m.flags = static_cast<unsigned>(mods);
    return m;
}

// The empty shape {}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tobject() {
    return make_leaf<Cap>("object");
}

template <std::size_t Cap, std::same_as<Member<Cap>>... Rest>
    requires(sizeof...(Rest) < MaxChildren)
consteval TypeExpr<Cap> tobject(const Member<Cap>& first,
                                const Rest&... rest) {
    const Member<Cap>* members[] = {&first, &rest...};
    constexpr int n = 1 + static_cast<int>(sizeof...(Rest));

    for (int i = 1; i < n; ++i)
        for (int j = 0; j < i; ++j)
            if (str_eq(members[i]->key, members[j]->key))
                report_error("duplicate key", members[i]->key);

    TypeExpr<Cap> result;
    TypeNode header = node_header("object");
    for (int i = 0; i < n; ++i) {
        TypeNode m = node_header("member", members[i]->key, members[i]->flags);
        m.children[0] = detail::copy_subtree(result.ast, members[i]->type.ast,
                                             members[i]->type.id);
        m.child_count = 1;
        header.children[i] = result.ast.add_node(m);
    }
    header.child_count = n;
    result.id = result.ast.add_node(header);
    return result;
}

namespace detail {

template <std::size_t Cap>
consteval void require_object(const TypeExpr<Cap>& t) {
    if (!is_object(t))
        report_error("expected an object shape", pretty_print(t).data);
}

template <std::size_t Cap>
consteval int find_member(const TypeExpr<Cap>& shape, const char* key) {
    const auto& n = shape.node();
    for (int i = 0; i < n.child_count; ++i)
        if (str_eq(shape.ast.nodes[n.children[i]].name, key))
            return n.children[i];
    return -1;
}

// Node id of the member `key`; a key the shape does not have is rejected.
template <std::size_t Cap>
consteval int require_member(const TypeExpr<Cap>& shape, const char* key,
                             const char* operation) {
    require_object(shape);
    int id = find_member(shape, key);
    if (id < 0)
        report_key_error("unknown key", key, shape, operation);
    return id;
}

template <std::size_t Cap>
consteval void require_members(const TypeExpr<Cap>& shape, const KeySet& keys,
                               const char* operation) {
    for (int i = 0; i < keys.count; ++i)
        require_member(shape, keys.names[i], operation);
}

// Member node ids of `shape` whose key is (or is not) in `keys`.
template <std::size_t Cap>
consteval int select_members(const TypeExpr<Cap>& shape, const KeySet& keys,
                             bool inside, int* ids) {
    const auto& n = shape.node();
    int count = 0;
    for (int i = 0; i < n.child_count; ++i) {
        int mid = n.children[i];
        if (keys.contains(shape.ast.nodes[mid].name) == inside)
            ids[count++] = mid;
    }
    return count;
}

} // namespace detail

// --- Member queries ---

template <std::size_t Cap>
consteval int member_count(const TypeExpr<Cap>& shape) {
    detail::require_object(shape);
    return shape.child_count();
}

template <std::size_t Cap>
consteval bool has_key(const TypeExpr<Cap>& shape, const char* key) {
    detail::require_object(shape);
    return detail::find_member(shape, key) >= 0;
}

template <std::size_t Cap>
consteval KeySet keys_of(const TypeExpr<Cap>& shape) {
    detail::require_object(shape);
    KeySet result{};
    const auto& n = shape.node();
    for (int i = 0; i < n.child_count; ++i)
        result = result.insert(shape.ast.nodes[n.children[i]].name);
    return result;
}

template <std::size_t Cap>
consteval unsigned member_flags(const TypeExpr<Cap>& shape, const char* key) {
    int id = detail::require_member(shape, key, "member_flags");
    return shape.ast.nodes[id].flags;
}

// The value type as written, without the `undefined` optionality adds.
template <std::size_t Cap>
consteval TypeExpr<Cap> declared_type(const TypeExpr<Cap>& shape,
                                      const char* key) {
    int id = detail::require_member(shape, key, "declared_type");
    return extract(shape.ast, shape.ast.nodes[id].children[0]);
}

// T[K]: the declared type, widened with `undefined` for optional members.
template <std::size_t Cap>
consteval TypeExpr<Cap> property_type(const TypeExpr<Cap>& shape,
                                      const char* key) {
    auto declared = declared_type(shape, key);
    if (has_modifier(member_flags(shape, key), Modifier::Optional))
        return tunion(declared, tundefined<Cap>());
    return declared;
}

// --- Shape transformations ---

// {[Q in K]: S[K]} with the member's modifiers intact.
template <std::size_t Cap>
consteval TypeExpr<Cap> slice(const TypeExpr<Cap>& shape, const char* key) {
    int id = detail::require_member(shape, key, "slice");
    return detail::assemble(node_header("object"), shape.ast, &id, 1);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> pick(const TypeExpr<Cap>& shape, const KeySet& keys) {
    detail::require_members(shape, keys, "pick");
    int ids[MaxChildren]{};
    int n = detail::select_members(shape, keys, true, ids);
    return detail::assemble(node_header("object"), shape.ast, ids, n);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> omit(const TypeExpr<Cap>& shape, const KeySet& keys) {
    detail::require_members(shape, keys, "omit");
    int ids[MaxChildren]{};
    int n = detail::select_members(shape, keys, false, ids);
    return detail::assemble(node_header("object"), shape.ast, ids, n);
}

// Members named in `keys` become optional; the rest are unchanged.
template <std::size_t Cap>
consteval TypeExpr<Cap> with_optional(const TypeExpr<Cap>& shape,
                                      const KeySet& keys) {
    detail::require_members(shape, keys, "with_optional");
    auto result = extract(shape.ast, shape.id);
    const auto& n = result.node();
    for (int i = 0; i < n.child_count; ++i) {
        auto& m = result.ast.nodes[n.children[i]];
        if (keys.contains(m.name))
            m.flags |= static_cast<unsigned>(Modifier::Optional);
    }
    return result;
}

} // namespace shapetype

#endif // SHAPETYPE_SHAPE_HPP
