#include <gtest/gtest.h>
#include <shapetype/equal.hpp>
#include <shapetype/union.hpp>

using namespace shapetype;

TEST(Union, TwoDistinctAlternatives) {
    constexpr auto u = tunion(TNumber, TString);
    static_assert(u.is("union"));
    static_assert(u.child_count() == 2);
    static_assert(alternative_count(u) == 2);
}

TEST(Union, DuplicatesCollapse) {
    static_assert(tunion(TNumber, TNumber).is("number"));
    static_assert(alternative_count(tunion(TNumber, TString, TNumber)) == 2);
    static_assert(
        alternative_count(tunion(tnum("1.0"), tnum("1"), tnum("2"))) == 2);
}

TEST(Union, NestedUnionsFlatten) {
    constexpr auto u = tunion(tunion(TNumber, TString), TBoolean);
    static_assert(u.child_count() == 3);
    static_assert(u.child(0).is("number"));
    static_assert(u.child(1).is("string"));
    static_assert(u.child(2).is("boolean"));
}

TEST(Union, NeverIsDropped) {
    static_assert(tunion(TNumber, TNever).is("number"));
    static_assert(tunion(TNever, TNever).is("never"));
    static_assert(alternative_count(tunion(TNever, TNever)) == 0);
}

TEST(Union, UnknownAbsorbs) {
    static_assert(tunion(TNumber, TUnknown).is("unknown"));
    static_assert(tunion(TUnknown, TNever).is("unknown"));
}

TEST(Union, SingleAlternativeCount) {
    static_assert(alternative_count(TNumber) == 1);
    static_assert(alternative_count(TNever) == 0);
}

TEST(Union, OrderDoesNotMatter) {
    static_assert(types_equal(tunion(TNumber, TString, TNull),
                              tunion(TNull, TString, TNumber)));
    static_assert(!types_equal(tunion(TNumber, TString),
                               tunion(TNumber, TString, TNull)));
}
