// 01_member_classification.cpp: Classifying the members of an object shape
//
// Shows: tobject(), prop() with ReadOnly/Optional, the key-set extractors,
//        pick_required(), pretty_print() of shapes and key sets.

#include <iostream>
#include <shapetype/shapetype.hpp>

using namespace shapetype;

int main() {
    // --- { readonly a: number; b?: string; run: () => void } ---
    constexpr auto s =
        tobject(prop("a", TNumber, ReadOnly), prop("b", TString, Optional),
                prop("run", tfn(TVoid)));

    constexpr auto text = pretty_print(s);
    static_assert(text == "{ readonly a: number; b?: string; run: () => void }");

    // Each pair splits the keys of s
    constexpr auto ro = pretty_print(readonly_keys(s));
    constexpr auto rw = pretty_print(writable_keys(s));
    constexpr auto opt = pretty_print(optional_keys(s));
    constexpr auto req = pretty_print(required_keys(s));
    constexpr auto fns = pretty_print(function_keys(s));
    constexpr auto data = pretty_print(non_function_keys(s));
    static_assert(ro == "{a}");
    static_assert(fns == "{run}");

    // Required members only, modifiers and value types kept
    constexpr auto required = pretty_print(pick_required(s));
    static_assert(required == "{ readonly a: number; run: () => void }");

    // Equal tells read-only apart; assignability does not
    constexpr auto frozen = tobject(prop("a", TNumber, ReadOnly));
    constexpr auto open = tobject(prop("a", TNumber));
    constexpr bool equal = types_equal(frozen, open);
    constexpr bool assignable = mutually_assignable(frozen, open);
    static_assert(!equal && assignable);

    std::cout << "shape:              " << text.data << "\n";
    std::cout << "readonly keys:      " << ro.data << "\n";
    std::cout << "writable keys:      " << rw.data << "\n";
    std::cout << "optional keys:      " << opt.data << "\n";
    std::cout << "required keys:      " << req.data << "\n";
    std::cout << "function keys:      " << fns.data << "\n";
    std::cout << "non-function keys:  " << data.data << "\n";
    std::cout << "pick_required:      " << required.data << "\n";
    std::cout << std::boolalpha;
    std::cout << "Equal({readonly a}, {a}):      " << equal << "\n";
    std::cout << "mutually assignable:           " << assignable << "\n";
}
