#ifndef SHAPETYPE_ASSIGN_HPP
#define SHAPETYPE_ASSIGN_HPP

#include <shapetype/ast.hpp>
#include <shapetype/equal.hpp>
#include <shapetype/str_utils.hpp>
#include <shapetype/type_expr.hpp>

namespace shapetype {

// --- Structural assignability ---
//
// is_assignable(source, target): a value of `source` may stand where a
// `target` is expected. Member modifiers other than optionality play no
// part, so read-only and writable members of one value type are mutually
// assignable.

namespace detail {

// Literal tag -> the primitive it widens to.
consteval const char* widened_tag(const char* tag) {
    if (str_eq(tag, "numlit")) return "number";
    if (str_eq(tag, "strlit")) return "string";
    if (str_eq(tag, "boollit")) return "boolean";
    return "";
}

// Values of every type except null, undefined and void (and the top type
// unknown) may stand where the empty shape {} is expected.
consteval bool is_nullish_tag(const char* tag) {
    return str_eq(tag, "null") || str_eq(tag, "undefined") ||
           str_eq(tag, "void");
}

template <std::size_t Cap>
consteval int find_member_node(const TypeAST<Cap>& ast, const TypeNode& obj,
                               const char* key) {
    for (int i = 0; i < obj.child_count; ++i)
        if (str_eq(ast.nodes[obj.children[i]].name, key))
            return obj.children[i];
    return -1;
}

template <std::size_t CapS, std::size_t CapT>
consteval bool assignable(const TypeAST<CapS>& sa, int si,
                          const TypeAST<CapT>& ta, int ti);

// fn/ctor: [0] = result, [1..] = params. Params are contravariant and the
// source may ignore trailing arguments; results are covariant.
template <std::size_t CapS, std::size_t CapT>
consteval bool signature_assignable(const TypeAST<CapS>& sa,
                                    const TypeNode& s,
                                    const TypeAST<CapT>& ta,
                                    const TypeNode& t) {
    if (s.child_count > t.child_count)
        return false;
    for (int i = 1; i < s.child_count; ++i)
        if (!assignable(ta, t.children[i], sa, s.children[i]))
            return false;
    if (str_eq(s.tag, "fn") && str_eq(ta.nodes[t.children[0]].tag, "void"))
        return true;
    return assignable(sa, s.children[0], ta, t.children[0]);
}

// Assignable to `target | undefined`, the read type of an optional member.
template <std::size_t CapS, std::size_t CapT>
consteval bool assignable_or_undefined(const TypeAST<CapS>& sa, int si,
                                       const TypeAST<CapT>& ta, int ti) {
    const auto& s = sa.nodes[si];
    if (str_eq(s.tag, "union")) {
        for (int i = 0; i < s.child_count; ++i)
            if (!assignable_or_undefined(sa, s.children[i], ta, ti))
                return false;
        return true;
    }
    return str_eq(s.tag, "undefined") || assignable(sa, si, ta, ti);
}

template <std::size_t CapS, std::size_t CapT>
consteval bool object_assignable(const TypeAST<CapS>& sa, const TypeNode& s,
                                 const TypeAST<CapT>& ta, const TypeNode& t) {
    for (int i = 0; i < t.child_count; ++i) {
        const auto& tm = ta.nodes[t.children[i]];
        bool target_optional = has_modifier(tm.flags, Modifier::Optional);
        int sid = find_member_node(sa, s, tm.name);
        if (sid < 0) {
            if (!target_optional)
                return false;
            continue;
        }
        const auto& sm = sa.nodes[sid];
        bool fits = target_optional
                        ? assignable_or_undefined(sa, sm.children[0], ta,
                                                  tm.children[0])
                        : assignable(sa, sm.children[0], ta, tm.children[0]);
        if (!fits)
            return false;
        // A possibly-absent source member never fills a required slot, even
        // one whose type accepts undefined.
        if (has_modifier(sm.flags, Modifier::Optional) && !target_optional)
            return false;
    }
    return true;
}

template <std::size_t CapS, std::size_t CapT>
consteval bool assignable(const TypeAST<CapS>& sa, int si,
                          const TypeAST<CapT>& ta, int ti) {
    const auto& s = sa.nodes[si];
    const auto& t = ta.nodes[ti];

    if (str_eq(s.tag, "never")) return true;
    if (str_eq(t.tag, "unknown")) return true;
    if (str_eq(s.tag, "unknown")) return false;

    if (str_eq(s.tag, "union")) {
        for (int i = 0; i < s.child_count; ++i)
            if (!assignable(sa, s.children[i], ta, ti))
                return false;
        return true;
    }
    if (str_eq(t.tag, "union")) {
        for (int i = 0; i < t.child_count; ++i)
            if (assignable(sa, si, ta, t.children[i]))
                return true;
        return false;
    }

    if (nodes_equal(sa, si, ta, ti)) return true;

    if (str_eq(widened_tag(s.tag), t.tag)) return true;
    if (str_eq(s.tag, "undefined") && str_eq(t.tag, "void")) return true;

    if (str_eq(t.tag, "function"))
        return str_eq(s.tag, "fn") || str_eq(s.tag, "ctor");

    if (str_eq(s.tag, "fn") && str_eq(t.tag, "fn"))
        return signature_assignable(sa, s, ta, t);
    if (str_eq(s.tag, "ctor") && str_eq(t.tag, "ctor"))
        return signature_assignable(sa, s, ta, t);

    if (str_eq(s.tag, "array") && str_eq(t.tag, "array"))
        return assignable(sa, s.children[0], ta, t.children[0]);

    if (str_eq(s.tag, "object") && str_eq(t.tag, "object"))
        return object_assignable(sa, s, ta, t);

    if (str_eq(t.tag, "object") && t.child_count == 0)
        return !is_nullish_tag(s.tag);

    return false;
}

} // namespace detail

template <std::size_t CapS, std::size_t CapT>
consteval bool is_assignable(const TypeExpr<CapS>& source,
                             const TypeExpr<CapT>& target) {
    return detail::assignable(source.ast, source.id, target.ast, target.id);
}

// Assignable both ways. Weaker than types_equal: blind to read-only.
template <std::size_t CapA, std::size_t CapB>
consteval bool mutually_assignable(const TypeExpr<CapA>& a,
                                   const TypeExpr<CapB>& b) {
    return is_assignable(a, b) && is_assignable(b, a);
}

} // namespace shapetype

#endif // SHAPETYPE_ASSIGN_HPP
