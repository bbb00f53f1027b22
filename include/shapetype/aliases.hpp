#ifndef SHAPETYPE_ALIASES_HPP
#define SHAPETYPE_ALIASES_HPP

#include <shapetype/diagnostics.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/types.hpp>
#include <shapetype/union.hpp>

namespace shapetype {

// --- Convenience aliases ---

template <std::size_t Cap>
consteval TypeExpr<Cap> nullable(const TypeExpr<Cap>& t) {
    return tunion(t, tnull<Cap>());
}

template <std::size_t Cap>
consteval TypeExpr<Cap> nullish(const TypeExpr<Cap>& t) {
    return tunion(t, tnull<Cap>(), tundefined<Cap>());
}

template <std::size_t Cap = 64> consteval TypeExpr<Cap> primitive() {
    return tunion(tbigint<Cap>(), tboolean<Cap>(), tnull<Cap>(),
                  tnumber<Cap>(), tstring<Cap>(), tsymbol<Cap>(),
                  tundefined<Cap>());
}

// "" | 0 | false | null | undefined
template <std::size_t Cap = 64> consteval TypeExpr<Cap> falsy() {
    return tunion(tstrlit<Cap>(""), tnum<Cap>(0), tboollit<Cap>(false),
                  tnull<Cap>(), tundefined<Cap>());
}

template <std::size_t Cap>
consteval TypeExpr<Cap> array_item(const TypeExpr<Cap>& array) {
    if (!array.is("array"))
        report_error("expected an array type", pretty_print(array).data);
    return array.child(0);
}

} // namespace shapetype

#endif // SHAPETYPE_ALIASES_HPP
