#ifndef SHAPETYPE_KEYS_HPP
#define SHAPETYPE_KEYS_HPP

#include <shapetype/category.hpp>
#include <shapetype/key_set.hpp>
#include <shapetype/mutability.hpp>
#include <shapetype/presence.hpp>
#include <shapetype/shape.hpp>

namespace shapetype {

// --- Key-set extractors ---
//
// Each pair (readonly/writable, optional/required, function/non-function)
// partitions keys_of(S).

namespace detail {

template <std::size_t Cap, typename Pred>
consteval KeySet collect_keys(const TypeExpr<Cap>& shape, Pred pred) {
    KeySet all = keys_of(shape);
    KeySet result{};
    for (int i = 0; i < all.count; ++i)
        if (pred(shape, all.names[i]))
            result = result.insert(all.names[i]);
    return result;
}

} // namespace detail

template <std::size_t Cap>
consteval KeySet readonly_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return is_readonly(s, k);
        });
}

template <std::size_t Cap>
consteval KeySet writable_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return is_writable(s, k);
        });
}

template <std::size_t Cap>
consteval KeySet optional_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return is_optional(s, k);
        });
}

template <std::size_t Cap>
consteval KeySet required_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return is_required(s, k);
        });
}

template <std::size_t Cap>
consteval KeySet function_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return is_function_valued(s, k);
        });
}

template <std::size_t Cap>
consteval KeySet non_function_keys(const TypeExpr<Cap>& shape) {
    return detail::collect_keys(
        shape, [](const TypeExpr<Cap>& s, const char* k) consteval {
            return !is_function_valued(s, k);
        });
}

// Keys whose property type is assignable to `target`. A target that no
// member matches is a usage error, not an empty answer.
template <std::size_t Cap, std::size_t CapT>
consteval KeySet keys_with_value_type(const TypeExpr<Cap>& shape,
                                      const TypeExpr<CapT>& target) {
    KeySet all = keys_of(shape);
    KeySet result{};
    for (int i = 0; i < all.count; ++i)
        if (matches_category(shape, all.names[i], target))
            result = result.insert(all.names[i]);
    if (result.empty())
        report_error("category matches no member", pretty_print(target).data,
                     pretty_print(shape).data, "keys_with_value_type");
    return result;
}

template <std::size_t Cap>
consteval TypeExpr<Cap> pick_required(const TypeExpr<Cap>& shape) {
    return pick(shape, required_keys(shape));
}

// --- Key bounds, e.g. template <FixedString K> requires FunctionKey<S, K> ---
//
// A key the shape does not have is a hard error, not an unsatisfied bound.

template <auto Shape, FixedString Key>
concept ReadonlyKey = is_readonly(Shape, Key.data);

template <auto Shape, FixedString Key>
concept WritableKey = is_writable(Shape, Key.data);

template <auto Shape, FixedString Key>
concept OptionalKey = is_optional(Shape, Key.data);

template <auto Shape, FixedString Key>
concept RequiredKey = is_required(Shape, Key.data);

template <auto Shape, FixedString Key>
concept FunctionKey = is_function_valued(Shape, Key.data);

template <auto Shape, FixedString Key>
concept NonFunctionKey = !is_function_valued(Shape, Key.data);

} // namespace shapetype

#endif // SHAPETYPE_KEYS_HPP
