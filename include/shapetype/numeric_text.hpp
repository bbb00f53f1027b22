#ifndef SHAPETYPE_NUMERIC_TEXT_HPP
#define SHAPETYPE_NUMERIC_TEXT_HPP

#include <concepts>

#include <shapetype/str_utils.hpp>

namespace shapetype {

// Canonical spelling of a numeric literal type. The grammar is
//   -?(0|[1-9][0-9]*)(\.[0-9]*[1-9])?
// with "-0" folded to "0". Magnitudes that the host notation prints with an
// exponent (>= 1e21, or below 1e-6) have no canonical spelling here.
struct NumericText {
    char text[MaxName]{};
};

consteval NumericText canonical_numeric(const char* spelling) {
    std::size_t i = 0;
    bool negative = false;
    if (spelling[i] == '-') {
        negative = true;
        ++i;
    }

    std::size_t int_begin = i;
    while (is_digit(spelling[i]))
        ++i;
    std::size_t int_end = i;
    if (int_end == int_begin)
        throw "shape error: malformed numeric literal (expected digits)";

    std::size_t frac_begin = i;
    std::size_t frac_end = i;
    if (spelling[i] == '.') {
        frac_begin = ++i;
        while (is_digit(spelling[i]))
            ++i;
        frac_end = i;
        if (frac_end == frac_begin)
            throw "shape error: malformed numeric literal "
                  "(expected digits after '.')";
    }
    if (spelling[i] != '\0')
        throw "shape error: malformed numeric literal "
              "(only digits, one leading '-' and one '.' are allowed)";

    while (int_end - int_begin > 1 && spelling[int_begin] == '0')
        ++int_begin;
    while (frac_end > frac_begin && spelling[frac_end - 1] == '0')
        --frac_end;

    bool int_is_zero = int_end - int_begin == 1 && spelling[int_begin] == '0';
    bool has_fraction = frac_end > frac_begin;

    if (int_end - int_begin > 21)
        throw "shape error: numeric literal has no canonical spelling "
              "without an exponent (magnitude >= 1e21)";
    if (int_is_zero && has_fraction) {
        std::size_t zeros = 0;
        while (spelling[frac_begin + zeros] == '0')
            ++zeros;
        if (zeros >= 6)
            throw "shape error: numeric literal has no canonical spelling "
                  "without an exponent (magnitude < 1e-6)";
    }
    if (int_is_zero && !has_fraction)
        negative = false;

    std::size_t length = (negative ? 1 : 0) + (int_end - int_begin) +
                         (has_fraction ? 1 + frac_end - frac_begin : 0);
    if (length >= MaxName)
        throw "shape error: numeric literal too long (max 31 characters)";

    NumericText out{};
    std::size_t o = 0;
    if (negative)
        out.text[o++] = '-';
    for (std::size_t k = int_begin; k < int_end; ++k)
        out.text[o++] = spelling[k];
    if (has_fraction) {
        out.text[o++] = '.';
        for (std::size_t k = frac_begin; k < frac_end; ++k)
            out.text[o++] = spelling[k];
    }
    return out;
}

template <std::integral I>
    requires(!std::same_as<I, bool>)
consteval NumericText canonical_numeric(I value) {
    char buf[MaxName]{};
    char digits[24]{};
    int n = 0;
    bool negative = value < 0;
    // Accumulate digits from the signed value so the minimum stays in range.
    do {
        int d = static_cast<int>(value % 10);
        digits[n++] = static_cast<char>('0' + (d < 0 ? -d : d));
        value /= 10;
    } while (value != 0);
    int o = 0;
    if (negative)
        buf[o++] = '-';
    while (n > 0)
        buf[o++] = digits[--n];
    return canonical_numeric(static_cast<const char*>(buf));
}

// --- Lexical tests over a canonical spelling ---

consteval bool text_is_negative(const char* text) { return text[0] == '-'; }

consteval bool text_has_fraction(const char* text) {
    return contains_char(text, '.');
}

} // namespace shapetype

#endif // SHAPETYPE_NUMERIC_TEXT_HPP
