#ifndef SHAPETYPE_AST_HPP
#define SHAPETYPE_AST_HPP

#include <cstddef>
#include <initializer_list>

#include <shapetype/str_utils.hpp>

namespace shapetype {

inline constexpr int MaxChildren = 16;

// --- Member modifiers ---

enum class Modifier : unsigned {
    None = 0,
    ReadOnly = 1u << 0,
    Optional = 1u << 1,
};

inline constexpr Modifier ReadOnly = Modifier::ReadOnly;
inline constexpr Modifier Optional = Modifier::Optional;

consteval Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<unsigned>(a) |
                                 static_cast<unsigned>(b));
}

consteval bool has_modifier(unsigned flags, Modifier m) {
    return (flags & static_cast<unsigned>(m)) != 0;
}

// --- Type node (structural type, usable as an NTTP) ---
//
// tag:   node kind ("number", "object", "member", "numlit", ...)
// name:  member key, or the canonical spelling of a literal
// flags: member modifiers (Modifier bits)

struct TypeNode {
    char tag[16]{};
    char name[MaxName]{};
    unsigned flags{0};
    int children[MaxChildren]{-1, -1, -1, -1, -1, -1, -1, -1,
                              -1, -1, -1, -1, -1, -1, -1, -1};
    int child_count{0};
};

consteval TypeNode node_header(const char* tag, const char* name = "",
                               unsigned flags = 0) {
    if (str_len(name) >= MaxName)
        throw "shape error: name too long (max 31 characters)";
    TypeNode n{};
    copy_str(n.tag, tag, sizeof(n.tag));
    copy_str(n.name, name);
    n.flags = flags;
    return n;
}

// --- Flat node storage (structural type, usable as an NTTP) ---

template <std::size_t Cap = 64> struct TypeAST {
    TypeNode nodes[Cap]{};
    std::size_t count{0};

    consteval int add_node(TypeNode n) {
        if (count >= Cap)
            throw "shape error: TypeAST capacity exceeded";
        int idx = static_cast<int>(count);
        nodes[count++] = n;
        return idx;
    }

    consteval int add_tagged_node(const char* tag,
                                  std::initializer_list<int> children) {
        if (children.size() > static_cast<std::size_t>(MaxChildren))
            throw "shape error: a node supports at most 16 children";
        TypeNode n = node_header(tag);
        int i = 0;
        for (int c : children)
            n.children[i++] = c;
        n.child_count = i;
        return add_node(n);
    }
};

namespace detail {

// Post-order copy: children land before their parent, so the copied root is
// always the last node added to dst.
template <std::size_t DstCap, std::size_t SrcCap>
consteval int copy_subtree(TypeAST<DstCap>& dst, const TypeAST<SrcCap>& src,
                           int src_id) {
    TypeNode n = src.nodes[src_id];
    int new_children[MaxChildren]{};
    for (int i = 0; i < n.child_count; ++i)
        new_children[i] = copy_subtree(dst, src, n.children[i]);
    for (int i = 0; i < n.child_count; ++i)
        n.children[i] = new_children[i];
    return dst.add_node(n);
}

} // namespace detail

} // namespace shapetype

#endif // SHAPETYPE_AST_HPP
