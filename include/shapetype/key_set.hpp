#ifndef SHAPETYPE_KEY_SET_HPP
#define SHAPETYPE_KEY_SET_HPP

#include <initializer_list>

#include <shapetype/str_utils.hpp>

namespace shapetype {

inline constexpr int MaxKeys = 16;

// Unordered set of member keys. Immutable: insert() returns a new set.
struct KeySet {
    char names[MaxKeys][MaxName]{};
    int count{0};

    consteval bool contains(const char* key) const {
        for (int i = 0; i < count; ++i)
            if (str_eq(names[i], key))
                return true;
        return false;
    }

    consteval KeySet insert(const char* key) const {
        if (contains(key))
            return *this;
        if (count >= MaxKeys)
            throw "shape error: KeySet capacity exceeded";
        if (str_len(key) >= MaxName)
            throw "shape error: key too long (max 31 characters)";
        KeySet result = *this;
        copy_str(result.names[result.count], key);
        result.count++;
        return result;
    }

    consteval int size() const { return count; }
    consteval bool empty() const { return count == 0; }

    consteval bool operator==(const KeySet& other) const {
        if (count != other.count)
            return false;
        for (int i = 0; i < count; ++i)
            if (!other.contains(names[i]))
                return false;
        return true;
    }
};

consteval KeySet key_set(std::initializer_list<const char*> keys) {
    KeySet result{};
    for (const char* k : keys)
        result = result.insert(k);
    return result;
}

// --- Set algebra ---

consteval KeySet set_union(const KeySet& a, const KeySet& b) {
    KeySet result = a;
    for (int i = 0; i < b.count; ++i)
        result = result.insert(b.names[i]);
    return result;
}

consteval KeySet set_intersection(const KeySet& a, const KeySet& b) {
    KeySet result{};
    for (int i = 0; i < a.count; ++i)
        if (b.contains(a.names[i]))
            result = result.insert(a.names[i]);
    return result;
}

consteval KeySet set_difference(const KeySet& a, const KeySet& b) {
    KeySet result{};
    for (int i = 0; i < a.count; ++i)
        if (!b.contains(a.names[i]))
            result = result.insert(a.names[i]);
    return result;
}

consteval bool disjoint(const KeySet& a, const KeySet& b) {
    return set_intersection(a, b).empty();
}

// a and b split `all` with no overlap and no omission.
consteval bool partitions(const KeySet& all, const KeySet& a,
                          const KeySet& b) {
    return disjoint(a, b) && set_union(a, b) == all;
}

} // namespace shapetype

#endif // SHAPETYPE_KEY_SET_HPP
