#include <gtest/gtest.h>
#include <shapetype/key_set.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/shape.hpp>

using namespace shapetype;

// --- Leaves ---

TEST(PrettyPrint, Keywords) {
    static_assert(pretty_print(TNumber) == "number");
    static_assert(pretty_print(TUndefined) == "undefined");
    static_assert(pretty_print(TNever) == "never");
    static_assert(pretty_print(TFunction) == "Function");
}

TEST(PrettyPrint, Literals) {
    static_assert(pretty_print(tnum("-5.20")) == "-5.2");
    static_assert(pretty_print(tstrlit("hi")) == "\"hi\"");
    static_assert(pretty_print(tboollit(true)) == "true");
}

// --- Composites ---

TEST(PrettyPrint, Functions) {
    static_assert(pretty_print(tfn(TVoid)) == "() => void");
    static_assert(pretty_print(tfn(TNumber, TString, TBoolean)) ==
                  "(arg0: string, arg1: boolean) => number");
    static_assert(pretty_print(tctor(TString, TNumber)) ==
                  "new (arg0: number) => string");
}

TEST(PrettyPrint, Arrays) {
    static_assert(pretty_print(tarray(TNumber)) == "number[]");
    static_assert(pretty_print(tarray(tarray(TString))) == "string[][]");
    static_assert(pretty_print(tarray(tunion(TNumber, TNull))) ==
                  "(number | null)[]");
    static_assert(pretty_print(tarray(tfn(TVoid))) == "(() => void)[]");
}

TEST(PrettyPrint, Unions) {
    static_assert(pretty_print(tunion(TNumber, TString, TUndefined)) ==
                  "number | string | undefined");
}

TEST(PrettyPrint, Objects) {
    static_assert(pretty_print(tobject()) == "{}");
    constexpr auto s =
        tobject(prop("a", TNumber, ReadOnly), prop("b", TString, Optional),
                prop("run", tfn(TVoid)));
    static_assert(pretty_print(s) ==
                  "{ readonly a: number; b?: string; run: () => void }");
}

TEST(PrettyPrint, NestedObject) {
    constexpr auto s = tobject(
        prop("p", tobject(prop("x", TNumber, ReadOnly | Optional))));
    static_assert(pretty_print(s) == "{ p: { readonly x?: number } }");
}

// --- Key sets ---

TEST(PrettyPrint, KeySets) {
    static_assert(pretty_print(KeySet{}) == "{}");
    static_assert(pretty_print(key_set({"a", "b", "run"})) == "{a, b, run}");
}
