#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <shapetype/equal.hpp>
#include <shapetype/keys.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/reflect.hpp>

using namespace shapetype;

namespace {

struct Widget {
    const double a;
    std::optional<std::string> b;
    std::function<void()> run;
};

struct Point {
    int x;
    int y;
};

struct Counter {
    const std::string label;
    std::vector<Point> history;
    std::optional<std::variant<int, std::string>> tag;
    std::function<bool(int)> accept;

    int value() const { return 0; }
    void bump(int by) noexcept { (void)by; }
};

struct Empty {};

} // namespace

template <> struct shapetype::shape_description<Widget> {
    using fields = field_list<field<"a", &Widget::a>, field<"b", &Widget::b>,
                              field<"run", &Widget::run>>;
};

template <> struct shapetype::shape_description<Point> {
    using fields = field_list<field<"x", &Point::x>, field<"y", &Point::y>>;
};

template <> struct shapetype::shape_description<Counter> {
    using fields =
        field_list<field<"label", &Counter::label>,
                   field<"history", &Counter::history>,
                   field<"tag", &Counter::tag>,
                   field<"accept", &Counter::accept>,
                   field<"value", &Counter::value>,
                   field<"bump", &Counter::bump>>;
};

template <> struct shapetype::shape_description<Empty> {
    using fields = field_list<>;
};

// --- Vocabulary types ---

TEST(TypeOf, Primitives) {
    static_assert(type_of<bool>().is("boolean"));
    static_assert(type_of<int>().is("number"));
    static_assert(type_of<std::uint64_t>().is("number"));
    static_assert(type_of<const double&>().is("number"));
    static_assert(type_of<std::string>().is("string"));
    static_assert(type_of<std::string_view>().is("string"));
    static_assert(type_of<const char*>().is("string"));
    static_assert(type_of<char*>().is("string"));
    static_assert(type_of<void>().is("void"));
    static_assert(type_of<std::nullptr_t>().is("null"));
    static_assert(type_of<std::monostate>().is("null"));
    static_assert(type_of<std::nullopt_t>().is("undefined"));
}

TEST(TypeOf, Optional) {
    static_assert(types_equal(type_of<std::optional<int>>(),
                              tunion(TNumber, TUndefined)));
}

TEST(TypeOf, Variant) {
    static_assert(types_equal(type_of<std::variant<int, std::string>>(),
                              tunion(TNumber, TString)));
    static_assert(type_of<std::variant<int, double>>().is("number"));
    static_assert(type_of<std::variant<std::string>>().is("string"));
    static_assert(types_equal(type_of<std::variant<std::monostate, bool>>(),
                              tunion(TNull, TBoolean)));
}

TEST(TypeOf, Sequences) {
    static_assert(types_equal(type_of<std::vector<int>>(), tarray(TNumber)));
    static_assert(
        types_equal(type_of<std::array<std::string, 3>>(), tarray(TString)));
}

TEST(TypeOf, Callables) {
    static_assert(types_equal(type_of<std::function<void()>>(), tfn(TVoid)));
    static_assert(types_equal(type_of<std::function<int(std::string, bool)>>(),
                              tfn(TNumber, TString, TBoolean)));
    static_assert(types_equal(type_of<bool (*)(int)>(), tfn(TBoolean, TNumber)));
    static_assert(
        types_equal(type_of<void (*)() noexcept>(), tfn(TVoid)));
}

// --- Described aggregates ---

TEST(ShapeOf, WidgetMembers) {
    constexpr auto w = shape_of<Widget>();
    static_assert(keys_of(w) == key_set({"a", "b", "run"}));
    static_assert(pretty_print(w) ==
                  "{ readonly a: number; b?: string; run: () => void }");
}

TEST(ShapeOf, WidgetClassification) {
    constexpr auto w = shape_of<Widget>();
    static_assert(readonly_keys(w) == key_set({"a"}));
    static_assert(optional_keys(w) == key_set({"b"}));
    static_assert(function_keys(w) == key_set({"run"}));
}

TEST(ShapeOf, MatchesHandWrittenShape) {
    constexpr auto expected =
        tobject(prop("a", TNumber, ReadOnly), prop("b", TString, Optional),
                prop("run", tfn(TVoid)));
    static_assert(types_equal(shape_of<Widget>(), expected));
}

TEST(ShapeOf, NestedDescribedType) {
    constexpr auto c = shape_of<Counter>();
    static_assert(types_equal(declared_type(c, "history"),
                              tarray(shape_of<Point>())));
    static_assert(types_equal(declared_type(c, "tag"),
                              tunion(TNumber, TString)));
}

TEST(ShapeOf, MemberFunctionsAreReadonlyMethods) {
    constexpr auto c = shape_of<Counter>();
    static_assert(types_equal(declared_type(c, "value"), tfn(TNumber)));
    static_assert(types_equal(declared_type(c, "bump"), tfn(TVoid, TNumber)));
    static_assert(readonly_keys(c) == key_set({"label", "value", "bump"}));
    static_assert(function_keys(c) == key_set({"accept", "value", "bump"}));
    static_assert(optional_keys(c) == key_set({"tag"}));
}

TEST(ShapeOf, EmptyAggregate) {
    static_assert(member_count(shape_of<Empty>()) == 0);
    static_assert(type_of<Empty>().is("object"));
}
