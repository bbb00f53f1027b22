#ifndef SHAPETYPE_DIAGNOSTICS_HPP
#define SHAPETYPE_DIAGNOSTICS_HPP

#include <shapetype/key_set.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/str_utils.hpp>
#include <shapetype/type_expr.hpp>

namespace shapetype {

// --- Structured error reporting ---
//
// Throwing from a consteval call ends constant evaluation, so every report
// surfaces as a compile error at the call site.

template <std::size_t N = 512>
consteval void report_error(const char* category, const char* expected,
                            const char* actual, const char* context) {
    FixedString<N> msg{};
    msg.append("shape error: ");
    msg.append(category);
    msg.append("\n  expected: ");
    msg.append(expected);
    msg.append("\n  actual:   ");
    msg.append(actual);
    msg.append("\n  at:       ");
    msg.append(context);
    throw msg.data;
}

template <std::size_t N = 512>
consteval void report_error(const char* category, const char* context) {
    FixedString<N> msg{};
    msg.append("shape error: ");
    msg.append(category);
    msg.append("\n  at: ");
    msg.append(context);
    throw msg.data;
}

// A key lookup against a shape failed: names the key, the operation, the
// keys the shape does have, and the shape itself.
template <std::size_t Cap, std::size_t N = 768>
consteval void report_key_error(const char* category, const char* key,
                                const TypeExpr<Cap>& shape,
                                const char* operation) {
    KeySet known{};
    const auto& n = shape.node();
    for (int i = 0; i < n.child_count; ++i)
        known = known.insert(shape.ast.nodes[n.children[i]].name);

    FixedString<N> msg{};
    msg.append("shape error: ");
    msg.append(category);
    msg.append(" '");
    msg.append(key);
    msg.append("'\n  in:         ");
    msg.append(operation);
    msg.append("\n  known keys: ");
    msg.append(pretty_print(known));
    msg.append("\n  shape:      ");
    msg.append(pretty_print(shape));
    throw msg.data;
}

} // namespace shapetype

#endif // SHAPETYPE_DIAGNOSTICS_HPP
