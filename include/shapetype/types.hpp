#ifndef SHAPETYPE_TYPES_HPP
#define SHAPETYPE_TYPES_HPP

#include <concepts>

#include <shapetype/numeric_text.hpp>
#include <shapetype/type_expr.hpp>

namespace shapetype {

// --- Primitive type constructors (leaf nodes, any Cap) ---

template <std::size_t Cap = 64> consteval TypeExpr<Cap> tnumber() {
    return make_leaf<Cap>("number");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tstring() {
    return make_leaf<Cap>("string");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tboolean() {
    return make_leaf<Cap>("boolean");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tbigint() {
    return make_leaf<Cap>("bigint");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tsymbol() {
    return make_leaf<Cap>("symbol");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tvoid() {
    return make_leaf<Cap>("void");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tnull() {
    return make_leaf<Cap>("null");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tundefined() {
    return make_leaf<Cap>("undefined");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tunknown() {
    return make_leaf<Cap>("unknown");
}
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tnever() {
    return make_leaf<Cap>("never");
}
// Top of the callable category: every fn and ctor is assignable to it.
template <std::size_t Cap = 64> consteval TypeExpr<Cap> tfunction() {
    return make_leaf<Cap>("function");
}

inline constexpr auto TNumber = tnumber();
inline constexpr auto TString = tstring();
inline constexpr auto TBoolean = tboolean();
inline constexpr auto TBigint = tbigint();
inline constexpr auto TSymbol = tsymbol();
inline constexpr auto TVoid = tvoid();
inline constexpr auto TNull = tnull();
inline constexpr auto TUndefined = tundefined();
inline constexpr auto TUnknown = tunknown();
inline constexpr auto TNever = tnever();
inline constexpr auto TFunction = tfunction();

// --- Literal types ---

// Numeric literal from its spelling; stored in canonical form.
template <std::size_t Cap = 64>
consteval TypeExpr<Cap> tnum(const char* spelling) {
    return make_leaf<Cap>("numlit", canonical_numeric(spelling).text);
}

template <std::size_t Cap = 64, std::integral I>
    requires(!std::same_as<I, bool>)
consteval TypeExpr<Cap> tnum(I value) {
    return make_leaf<Cap>("numlit", canonical_numeric(value).text);
}

template <std::size_t Cap = 64>
consteval TypeExpr<Cap> tstrlit(const char* text) {
    return make_leaf<Cap>("strlit", text);
}

template <std::size_t Cap = 64> consteval TypeExpr<Cap> tboollit(bool value) {
    return make_leaf<Cap>("boollit", value ? "true" : "false");
}

// A numeric literal spelled as a template argument, e.g. num<"-3.5">.
// Single-node capacity keeps it cheap to pass as an NTTP.
template <FixedString Spelling>
inline constexpr auto num = tnum<1>(Spelling.data);

// --- Composite type constructors ---

// Function type: (params...) => ret
template <std::size_t Cap, std::same_as<TypeExpr<Cap>>... Params>
consteval TypeExpr<Cap> tfn(const TypeExpr<Cap>& ret,
                            const Params&... params) {
    return make_node("fn", ret, params...);
}

// Constructor type: new (params...) => instance
template <std::size_t Cap, std::same_as<TypeExpr<Cap>>... Params>
consteval TypeExpr<Cap> tctor(const TypeExpr<Cap>& instance,
                              const Params&... params) {
    return make_node("ctor", instance, params...);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> tarray(const TypeExpr<Cap>& element) {
    return make_node("array", element);
}

// --- Node classification ---

template <std::size_t Cap> consteval bool is_literal(const TypeExpr<Cap>& t) {
    return t.is("numlit") || t.is("strlit") || t.is("boollit");
}

template <std::size_t Cap> consteval bool is_object(const TypeExpr<Cap>& t) {
    return t.is("object");
}

template <std::size_t Cap> consteval bool is_union(const TypeExpr<Cap>& t) {
    return t.is("union");
}

// Function type accessors: fn(ret, params...): [0]=ret, [1..]=params
template <std::size_t Cap>
consteval int param_count(const TypeExpr<Cap>& fn) {
    return fn.child_count() - 1;
}

template <std::size_t Cap>
consteval TypeExpr<Cap> return_type(const TypeExpr<Cap>& fn) {
    return fn.child(0);
}

template <std::size_t Cap>
consteval TypeExpr<Cap> param_type(const TypeExpr<Cap>& fn, int i) {
    return fn.child(1 + i);
}

} // namespace shapetype

#endif // SHAPETYPE_TYPES_HPP
