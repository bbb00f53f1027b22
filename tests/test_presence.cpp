#include <gtest/gtest.h>
#include <shapetype/presence.hpp>

using namespace shapetype;

namespace {

constexpr auto Scenario =
    tobject(prop("a", TNumber, ReadOnly), prop("b", TString, Optional),
            prop("run", tfn(TVoid)));

} // namespace

TEST(Presence, ScenarioMembers) {
    static_assert(is_required(Scenario, "a"));
    static_assert(is_optional(Scenario, "b"));
    static_assert(is_required(Scenario, "run"));
}

TEST(Presence, ReadonlyDoesNotAffectPresence) {
    constexpr auto s = tobject(prop("x", TNumber, ReadOnly | Optional),
                               prop("y", TNumber, ReadOnly));
    static_assert(is_optional(s, "x"));
    static_assert(is_required(s, "y"));
}

// A required member whose value type admits undefined is still required.
TEST(Presence, UndefinedValueTypeIsStillRequired) {
    constexpr auto s = tobject(prop("u", tunion(TNumber, TUndefined)),
                               prop("v", TUndefined));
    static_assert(is_required(s, "u"));
    static_assert(is_required(s, "v"));
}

TEST(Presence, OptionalFunctionMember) {
    constexpr auto s = tobject(prop("cb", tfn(TVoid, TString), Optional));
    static_assert(is_optional(s, "cb"));
}

TEST(Presence, WithOptionalMakesKeysOptional) {
    constexpr auto s = with_optional(Scenario, key_set({"a"}));
    static_assert(is_optional(s, "a"));
    static_assert(is_required(s, "run"));
}

TEST(Presence, ExactlyOneHolds) {
    static_assert(is_optional(Scenario, "a") != is_required(Scenario, "a"));
    static_assert(is_optional(Scenario, "b") != is_required(Scenario, "b"));
}
