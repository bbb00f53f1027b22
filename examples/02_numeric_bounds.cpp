// 02_numeric_bounds.cpp: Numeric literal classification and generic bounds
//
// Shows: num<"...">, canonical spelling, is_integer()/is_positive()/
//        is_negative(), PositiveInteger and Negative as requires-clauses.

#include <iostream>
#include <shapetype/shapetype.hpp>

using namespace shapetype;

// A grid dimension must be a positive integer literal
template <auto Rows, auto Cols>
    requires PositiveInteger<Rows> && PositiveInteger<Cols>
struct Grid {
    static constexpr auto rows = pretty_print(Rows);
    static constexpr auto cols = pretty_print(Cols);
};

template <auto Offset>
    requires Negative<Offset>
consteval auto describe_offset() {
    return pretty_print(Offset);
}

template <FixedString Spelling> void classify() {
    constexpr auto n = num<Spelling>;
    constexpr auto text = pretty_print(n);
    constexpr bool integer = is_integer(n);
    constexpr bool positive = is_positive(n);
    constexpr bool negative = is_negative(n);
    std::cout << Spelling.data << " -> " << text.data
              << "  integer=" << integer << "  positive=" << positive
              << "  negative=" << negative << "\n";
}

int main() {
    std::cout << std::boolalpha;

    // --- Classification table ---
    classify<"5">();
    classify<"-5">();
    classify<"5.2">();
    classify<"-5.2">();
    classify<"0">();
    classify<"-0">();
    classify<"007.50">();

    static_assert(is_positive_integer(num<"5">));
    static_assert(is_negative_integer(num<"-5">));
    static_assert(!is_integer(num<"5.2">));
    static_assert(is_positive_integer(num<"0">));

    // --- Bounds ---
    using G = Grid<num<"3">, num<"4">>;
    static_assert(G::rows == "3");

    constexpr auto offset = describe_offset<num<"-1.5">>();
    std::cout << "grid: " << G::rows.data << " x " << G::cols.data << "\n";
    std::cout << "offset: " << offset.data << "\n";
}
