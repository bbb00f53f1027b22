#ifndef SHAPETYPE_PRESENCE_HPP
#define SHAPETYPE_PRESENCE_HPP

#include <shapetype/assign.hpp>
#include <shapetype/shape.hpp>

namespace shapetype {

// Optional iff a value with no members at all can stand in for the
// single-member slice.
template <std::size_t Cap>
consteval bool is_optional(const TypeExpr<Cap>& shape, const char* key) {
    return is_assignable(tobject<Cap>(), slice(shape, key));
}

template <std::size_t Cap>
consteval bool is_required(const TypeExpr<Cap>& shape, const char* key) {
    return !is_optional(shape, key);
}

} // namespace shapetype

#endif // SHAPETYPE_PRESENCE_HPP
