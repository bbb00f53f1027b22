#include <gtest/gtest.h>
#include <shapetype/category.hpp>

using namespace shapetype;

namespace {

constexpr auto Scenario =
    tobject(prop("a", TNumber, ReadOnly), prop("b", TString, Optional),
            prop("run", tfn(TVoid)));

} // namespace

// --- Exclude / NonIndefinable ---

TEST(Exclude, RemovesAssignableAlternatives) {
    constexpr auto u = tunion(TNumber, TString, TUndefined);
    static_assert(types_equal(exclude(u, TString), tunion(TNumber, TUndefined)));
    static_assert(exclude(u, TUnknown).is("never"));
    static_assert(exclude(TNumber, TNumber).is("never"));
    static_assert(exclude(TNumber, TString).is("number"));
}

TEST(Exclude, LiteralsExcludedByTheirPrimitive) {
    constexpr auto u = tunion(tnum("1"), tnum("2"), TString);
    static_assert(exclude(u, TNumber).is("string"));
}

TEST(NonIndefinable, StripsUndefined) {
    static_assert(non_indefinable(tunion(TNumber, TUndefined)).is("number"));
    static_assert(non_indefinable(TUndefined).is("never"));
    static_assert(non_indefinable(TNumber).is("number"));
    static_assert(types_equal(non_indefinable(tunion(TNumber, TNull, TUndefined)),
                              tunion(TNumber, TNull)));
}

// --- Callability ---

TEST(Callable, Signatures) {
    static_assert(is_callable(tfn(TVoid)));
    static_assert(is_callable(tfn(TNumber, TString, TString)));
    static_assert(is_callable(tctor(TString)));
    static_assert(is_callable(TFunction));
}

TEST(Callable, NonCallables) {
    static_assert(!is_callable(TNumber));
    static_assert(!is_callable(tobject()));
    static_assert(!is_callable(TUnknown));
    static_assert(!is_callable(tunion(tfn(TVoid), TNull)));
}

TEST(Callable, NeverIsNotCallable) {
    static_assert(!is_callable(TNever));
}

TEST(Callable, UnionOfSignatures) {
    static_assert(is_callable(tunion(tfn(TVoid), tfn(TNumber, TString))));
}

// --- Function-valued members ---

TEST(FunctionValued, ScenarioMembers) {
    static_assert(!is_function_valued(Scenario, "a"));
    static_assert(!is_function_valued(Scenario, "b"));
    static_assert(is_function_valued(Scenario, "run"));
}

TEST(FunctionValued, OptionalMethodIsFunctionValued) {
    constexpr auto s = tobject(prop("cb", tfn(TVoid, TString), Optional));
    static_assert(is_function_valued(s, "cb"));
}

TEST(FunctionValued, NullableMethodIsNot) {
    constexpr auto s = tobject(prop("cb", tunion(tfn(TVoid), TNull)));
    static_assert(!is_function_valued(s, "cb"));
}

// Stripping undefined from `u?: undefined` leaves never. A non-distributive
// `never extends Function` test would call u a function key; here never has
// no values to call, so u is a non-function key.
TEST(FunctionValued, UndefinedOnlyMemberIsNot) {
    constexpr auto s = tobject(prop("u", TUndefined, Optional));
    static_assert(!is_function_valued(s, "u"));
}

// --- Arbitrary categories ---

TEST(MatchesCategory, AgainstPrimitives) {
    static_assert(matches_category(Scenario, "a", TNumber));
    static_assert(!matches_category(Scenario, "a", TString));
    // Optional members carry undefined.
    static_assert(!matches_category(Scenario, "b", TString));
    static_assert(
        matches_category(Scenario, "b", tunion(TString, TUndefined)));
    static_assert(matches_category(Scenario, "run", TFunction));
}

TEST(MatchesCategory, LiteralTargets) {
    constexpr auto s = tobject(prop("five", tnum("5")), prop("n", TNumber));
    static_assert(matches_category(s, "five", num<"5">));
    static_assert(!matches_category(s, "n", num<"5">));
}
