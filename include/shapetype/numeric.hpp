#ifndef SHAPETYPE_NUMERIC_HPP
#define SHAPETYPE_NUMERIC_HPP

#include <shapetype/diagnostics.hpp>
#include <shapetype/numeric_text.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/types.hpp>

namespace shapetype {

// --- Numeric literal classification ---
//
// Purely lexical over the canonical spelling: a leading '-' means negative,
// a '.' means not integer. Magnitude is never computed. Zero is spelled "0"
// (never "-0"), so it classifies as a positive integer.

template <std::size_t Cap>
consteval bool is_numeric_literal(const TypeExpr<Cap>& t) {
    return t.is("numlit");
}

namespace detail {

template <std::size_t Cap>
consteval const char* literal_text(const TypeExpr<Cap>& t) {
    if (!is_numeric_literal(t))
        report_error("malformed input", "a single numeric literal type",
                     pretty_print(t).data, "numeric literal classification");
    return t.node().name;
}

} // namespace detail

template <std::size_t Cap>
consteval bool is_integer(const TypeExpr<Cap>& n) {
    return !text_has_fraction(detail::literal_text(n));
}

template <std::size_t Cap>
consteval bool is_negative(const TypeExpr<Cap>& n) {
    return text_is_negative(detail::literal_text(n));
}

template <std::size_t Cap>
consteval bool is_positive(const TypeExpr<Cap>& n) {
    return !text_is_negative(detail::literal_text(n));
}

template <std::size_t Cap>
consteval bool is_positive_integer(const TypeExpr<Cap>& n) {
    return is_positive(n) && is_integer(n);
}

template <std::size_t Cap>
consteval bool is_negative_integer(const TypeExpr<Cap>& n) {
    return is_negative(n) && is_integer(n);
}

// --- Generic bounds over a literal NTTP, e.g. PositiveInteger<num<"3">> ---

template <auto N>
concept Integer = is_integer(N);

template <auto N>
concept Positive = is_positive(N);

template <auto N>
concept Negative = is_negative(N);

template <auto N>
concept PositiveInteger = is_positive_integer(N);

template <auto N>
concept NegativeInteger = is_negative_integer(N);

} // namespace shapetype

#endif // SHAPETYPE_NUMERIC_HPP
