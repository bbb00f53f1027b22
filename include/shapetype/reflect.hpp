#ifndef SHAPETYPE_REFLECT_HPP
#define SHAPETYPE_REFLECT_HPP

// Bridge from C++ types to type descriptions.
//
// Provides: type_of<T>() for standard vocabulary types, and shape_of<T>() for
// aggregates described through shape_description<T>:
//
//   struct Widget { const double a; std::optional<std::string> b;
//                   std::function<void()> run; };
//   template <> struct shapetype::shape_description<Widget> {
//       using fields = field_list<field<"a", &Widget::a>,
//                                 field<"b", &Widget::b>,
//                                 field<"run", &Widget::run>>;
//   };
//
// A const data member is read-only, a std::optional data member is optional,
// and a member function is a read-only function-valued member (it cannot be
// rebound). Other types plug in by specializing type_mapping<T>.

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <shapetype/shape.hpp>
#include <shapetype/types.hpp>
#include <shapetype/union.hpp>

namespace shapetype {

template <typename> inline constexpr bool dependent_false = false;

// --- Described aggregates ---

template <FixedString Key, auto MemberPtr> struct field {
    static constexpr auto key = Key;
    static constexpr auto pointer = MemberPtr;
};

template <typename... Fields> struct field_list {};

// Specialize with `using fields = field_list<field<...>...>;`
template <typename T> struct shape_description {};

template <typename T>
concept described = requires { typename shape_description<T>::fields; };

template <typename T, std::size_t Cap = 64> consteval TypeExpr<Cap> type_of();
template <typename T, std::size_t Cap = 64> consteval TypeExpr<Cap> shape_of();

// --- Type mapping (customization point) ---
//
// A specialization provides `template <std::size_t Cap> static consteval
// TypeExpr<Cap> make()`.

template <typename T> struct type_mapping {
    static_assert(dependent_false<T>,
                  "no type description for this C++ type; describe it with "
                  "shapetype::shape_description or specialize "
                  "shapetype::type_mapping");
};

template <> struct type_mapping<bool> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tboolean<Cap>();
    }
};

template <typename T>
    requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
struct type_mapping<T> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tnumber<Cap>();
    }
};

template <typename T>
    requires(std::is_same_v<T, std::string> ||
             std::is_same_v<T, std::string_view> ||
             std::is_same_v<T, const char*>)
struct type_mapping<T> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tstring<Cap>();
    }
};

template <> struct type_mapping<void> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tvoid<Cap>();
    }
};

template <typename T>
    requires(std::is_same_v<T, std::nullptr_t> ||
             std::is_same_v<T, std::monostate>)
struct type_mapping<T> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tnull<Cap>();
    }
};

template <> struct type_mapping<std::nullopt_t> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tundefined<Cap>();
    }
};

template <typename T> struct type_mapping<std::optional<T>> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tunion(type_of<T, Cap>(), tundefined<Cap>());
    }
};

template <typename T0, typename... Ts>
struct type_mapping<std::variant<T0, Ts...>> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        if constexpr (sizeof...(Ts) == 0)
            return type_of<T0, Cap>();
        else
            return tunion(type_of<T0, Cap>(), type_of<Ts, Cap>()...);
    }
};

template <typename T, typename Alloc>
struct type_mapping<std::vector<T, Alloc>> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tarray(type_of<T, Cap>());
    }
};

template <typename T, std::size_t N> struct type_mapping<std::array<T, N>> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tarray(type_of<T, Cap>());
    }
};

template <typename R, typename... A> struct type_mapping<std::function<R(A...)>> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tfn(type_of<R, Cap>(), type_of<A, Cap>()...);
    }
};

template <typename R, typename... A> struct type_mapping<R (*)(A...)> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tfn(type_of<R, Cap>(), type_of<A, Cap>()...);
    }
};

template <typename R, typename... A>
struct type_mapping<R (*)(A...) noexcept> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return tfn(type_of<R, Cap>(), type_of<A, Cap>()...);
    }
};

template <described T> struct type_mapping<T> {
    template <std::size_t Cap> static consteval TypeExpr<Cap> make() {
        return shape_of<T, Cap>();
    }
};

// --- Pointer-to-member decomposition ---

namespace detail {

template <typename M> struct member_pointer_traits;
template <typename C, typename M> struct member_pointer_traits<M C::*> {
    using class_type = C;
    using member_type = M;
};

template <typename T> struct optional_traits {
    static constexpr bool is_optional = false;
    using value_type = T;
};
template <typename T> struct optional_traits<std::optional<T>> {
    static constexpr bool is_optional = true;
    using value_type = T;
};

// Function type of a member function, with its qualifiers dropped.
template <typename F> struct signature_traits;
template <typename R, typename... A> struct signature_traits<R(A...)> {
    using type = R (*)(A...);
};
template <typename R, typename... A> struct signature_traits<R(A...) const> {
    using type = R (*)(A...);
};
template <typename R, typename... A>
struct signature_traits<R(A...) noexcept> {
    using type = R (*)(A...);
};
template <typename R, typename... A>
struct signature_traits<R(A...) const noexcept> {
    using type = R (*)(A...);
};

template <typename Field, std::size_t Cap> consteval Member<Cap> member_of() {
    using M = typename member_pointer_traits<
        std::remove_cv_t<decltype(Field::pointer)>>::member_type;
    if constexpr (std::is_function_v<M>) {
        using Sig = typename signature_traits<M>::type;
        return prop(Field::key.data, type_of<Sig, Cap>(), Modifier::ReadOnly);
    } else {
        using Opt = optional_traits<std::remove_cv_t<M>>;
        Modifier mods = Modifier::None;
        if constexpr (std::is_const_v<M>)
            mods = mods | Modifier::ReadOnly;
        if constexpr (Opt::is_optional)
            mods = mods | Modifier::Optional;
        return prop(Field::key.data,
                    type_of<typename Opt::value_type, Cap>(), mods);
    }
}

template <std::size_t Cap, typename... Fields>
consteval TypeExpr<Cap> shape_from(field_list<Fields...>) {
    if constexpr (sizeof...(Fields) == 0)
        return tobject<Cap>();
    else
        return tobject(member_of<Fields, Cap>()...);
}

} // namespace detail

template <typename T, std::size_t Cap> consteval TypeExpr<Cap> type_of() {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, char*>)
        return type_mapping<const char*>::template make<Cap>();
    else
        return type_mapping<U>::template make<Cap>();
}

template <typename T, std::size_t Cap> consteval TypeExpr<Cap> shape_of() {
    static_assert(described<T>,
                  "shape_of requires a shape_description<T> specialization");
    return detail::shape_from<Cap>(typename shape_description<T>::fields{});
}

} // namespace shapetype

#endif // SHAPETYPE_REFLECT_HPP
