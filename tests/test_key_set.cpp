#include <gtest/gtest.h>
#include <shapetype/key_set.hpp>

using namespace shapetype;

TEST(KeySet, EmptyByDefault) {
    constexpr KeySet k{};
    static_assert(k.empty());
    static_assert(k.size() == 0);
    static_assert(!k.contains("a"));
}

TEST(KeySet, InsertReturnsNewSet) {
    constexpr KeySet a{};
    constexpr KeySet b = a.insert("x");
    static_assert(a.empty());
    static_assert(b.size() == 1);
    static_assert(b.contains("x"));
}

TEST(KeySet, InsertIgnoresDuplicates) {
    static_assert(key_set({"a", "b", "a"}).size() == 2);
}

TEST(KeySet, EqualityIgnoresOrder) {
    static_assert(key_set({"a", "b"}) == key_set({"b", "a"}));
    static_assert(!(key_set({"a", "b"}) == key_set({"a"})));
    static_assert(!(key_set({"a"}) == key_set({"b"})));
    static_assert(KeySet{} == key_set({}));
}

TEST(KeySet, HoldsMaximumKeys) {
    constexpr auto k = key_set({"k0", "k1", "k2", "k3", "k4", "k5", "k6",
                                "k7", "k8", "k9", "k10", "k11", "k12", "k13",
                                "k14", "k15"});
    static_assert(k.size() == MaxKeys);
    static_assert(k.contains("k15"));
}

// --- Set algebra ---

TEST(KeySetAlgebra, Union) {
    static_assert(set_union(key_set({"a", "b"}), key_set({"b", "c"})) ==
                  key_set({"a", "b", "c"}));
    static_assert(set_union(KeySet{}, key_set({"a"})) == key_set({"a"}));
}

TEST(KeySetAlgebra, Intersection) {
    static_assert(set_intersection(key_set({"a", "b"}), key_set({"b", "c"})) ==
                  key_set({"b"}));
    static_assert(set_intersection(key_set({"a"}), key_set({"c"})).empty());
}

TEST(KeySetAlgebra, Difference) {
    static_assert(set_difference(key_set({"a", "b", "c"}), key_set({"b"})) ==
                  key_set({"a", "c"}));
    static_assert(set_difference(key_set({"a"}), key_set({"a"})).empty());
}

TEST(KeySetAlgebra, Disjoint) {
    static_assert(disjoint(key_set({"a"}), key_set({"b"})));
    static_assert(!disjoint(key_set({"a", "b"}), key_set({"b"})));
    static_assert(disjoint(KeySet{}, KeySet{}));
}

TEST(KeySetAlgebra, Partitions) {
    constexpr auto all = key_set({"a", "b", "run"});
    static_assert(partitions(all, key_set({"a"}), key_set({"b", "run"})));
    static_assert(partitions(all, KeySet{}, all));
    // Overlap
    static_assert(!partitions(all, key_set({"a", "b"}), key_set({"b", "run"})));
    // Omission
    static_assert(!partitions(all, key_set({"a"}), key_set({"b"})));
}
