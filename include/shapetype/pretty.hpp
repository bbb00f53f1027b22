#ifndef SHAPETYPE_PRETTY_HPP
#define SHAPETYPE_PRETTY_HPP

#include <shapetype/key_set.hpp>
#include <shapetype/str_utils.hpp>
#include <shapetype/type_expr.hpp>

namespace shapetype {

namespace detail {

consteval bool is_keyword_tag(const char* tag) {
    return str_eq(tag, "number") || str_eq(tag, "string") ||
           str_eq(tag, "boolean") || str_eq(tag, "bigint") ||
           str_eq(tag, "symbol") || str_eq(tag, "void") ||
           str_eq(tag, "null") || str_eq(tag, "undefined") ||
           str_eq(tag, "unknown") || str_eq(tag, "never");
}

template <std::size_t Cap>
consteval FixedString<256> pp_node(const TypeAST<Cap>& ast, int id);

// (arg0: A, arg1: B)
template <std::size_t Cap>
consteval FixedString<256> pp_params(const TypeAST<Cap>& ast,
                                     const TypeNode& n) {
    FixedString<256> s;
    s.append_char('(');
    for (int i = 1; i < n.child_count; ++i) {
        if (i > 1)
            s.append(", ");
        s.append("arg");
        s.append_int(i - 1);
        s.append(": ");
        s.append(pp_node(ast, n.children[i]));
    }
    s.append_char(')');
    return s;
}

template <std::size_t Cap>
consteval FixedString<256> pp_node(const TypeAST<Cap>& ast, int id) {
    const auto& n = ast.nodes[id];
    FixedString<256> s;

    if (is_keyword_tag(n.tag)) {
        s.append(n.tag);
        return s;
    }
    if (str_eq(n.tag, "function")) {
        s.append("Function");
        return s;
    }
    if (str_eq(n.tag, "numlit") || str_eq(n.tag, "boollit")) {
        s.append(n.name);
        return s;
    }
    if (str_eq(n.tag, "strlit")) {
        s.append_char('"');
        s.append(n.name);
        s.append_char('"');
        return s;
    }

    // (arg0: A) => R
    if (str_eq(n.tag, "fn")) {
        s.append(pp_params(ast, n));
        s.append(" => ");
        s.append(pp_node(ast, n.children[0]));
        return s;
    }
    // new (arg0: A) => T
    if (str_eq(n.tag, "ctor")) {
        s.append("new ");
        s.append(pp_params(ast, n));
        s.append(" => ");
        s.append(pp_node(ast, n.children[0]));
        return s;
    }

    // T[]; compound element types are parenthesized
    if (str_eq(n.tag, "array")) {
        const auto& elem = ast.nodes[n.children[0]];
        bool wrap = str_eq(elem.tag, "union") || str_eq(elem.tag, "fn") ||
                    str_eq(elem.tag, "ctor");
        if (wrap)
            s.append_char('(');
        s.append(pp_node(ast, n.children[0]));
        if (wrap)
            s.append_char(')');
        s.append("[]");
        return s;
    }

    if (str_eq(n.tag, "union")) {
        for (int i = 0; i < n.child_count; ++i) {
            if (i > 0)
                s.append(" | ");
            s.append(pp_node(ast, n.children[i]));
        }
        return s;
    }

    // { readonly a: number; b?: string }
    if (str_eq(n.tag, "object")) {
        if (n.child_count == 0) {
            s.append("{}");
            return s;
        }
        s.append("{ ");
        for (int i = 0; i < n.child_count; ++i) {
            if (i > 0)
                s.append("; ");
            s.append(pp_node(ast, n.children[i]));
        }
        s.append(" }");
        return s;
    }
    if (str_eq(n.tag, "member")) {
        if (has_modifier(n.flags, Modifier::ReadOnly))
            s.append("readonly ");
        s.append(n.name);
        if (has_modifier(n.flags, Modifier::Optional))
            s.append_char('?');
        s.append(": ");
        s.append(pp_node(ast, n.children[0]));
        return s;
    }

    // Unknown tag: tag(child, child, ...)
    s.append(n.tag);
    s.append_char('(');
    for (int i = 0; i < n.child_count; ++i) {
        if (i > 0)
            s.append(", ");
        s.append(pp_node(ast, n.children[i]));
    }
    s.append_char(')');
    return s;
}

} // namespace detail

template <std::size_t Cap>
consteval FixedString<256> pretty_print(const TypeExpr<Cap>& t) {
    return detail::pp_node(t.ast, t.id);
}

// {a, b, run}
consteval FixedString<256> pretty_print(const KeySet& keys) {
    FixedString<256> s;
    s.append_char('{');
    for (int i = 0; i < keys.count; ++i) {
        if (i > 0)
            s.append(", ");
        s.append(keys.names[i]);
    }
    s.append_char('}');
    return s;
}

} // namespace shapetype

#endif // SHAPETYPE_PRETTY_HPP
