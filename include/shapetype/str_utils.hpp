#ifndef SHAPETYPE_STR_UTILS_HPP
#define SHAPETYPE_STR_UTILS_HPP

#include <cstddef>

namespace shapetype {

// Longest key or literal spelling stored in a node, including the terminator.
inline constexpr std::size_t MaxName = 32;

consteval void copy_str(char* dst, const char* src,
                        std::size_t max_len = MaxName) {
    std::size_t i = 0;
    for (; i < max_len - 1 && src[i] != '\0'; ++i)
        dst[i] = src[i];
    dst[i] = '\0';
}

consteval bool str_eq(const char* a, const char* b) {
    for (std::size_t i = 0;; ++i) {
        if (a[i] != b[i])
            return false;
        if (a[i] == '\0')
            return true;
    }
}

consteval std::size_t str_len(const char* s) {
    std::size_t len = 0;
    while (s[len] != '\0')
        ++len;
    return len;
}

consteval bool contains_char(const char* s, char c) {
    for (std::size_t i = 0; s[i] != '\0'; ++i)
        if (s[i] == c)
            return true;
    return false;
}

consteval bool is_digit(char c) { return c >= '0' && c <= '9'; }

// --- FixedString: append-only builder, also usable as an NTTP ---

template <std::size_t N = 256> struct FixedString {
    char data[N]{};
    std::size_t len{0};

    consteval FixedString() = default;
    consteval FixedString(const char* s) {
        while (s[len] != '\0' && len < N - 1) {
            data[len] = s[len];
            ++len;
        }
    }

    consteval void append(const char* s) {
        for (std::size_t i = 0; s[i] != '\0' && len < N - 1; ++i)
            data[len++] = s[i];
    }
    template <std::size_t M> consteval void append(const FixedString<M>& o) {
        for (std::size_t i = 0; i < o.len && len < N - 1; ++i)
            data[len++] = o.data[i];
    }
    consteval void append_char(char c) {
        if (len < N - 1)
            data[len++] = c;
    }

    consteval void append_int(int v) {
        if (v < 0) {
            append_char('-');
            v = -v;
        }
        if (v == 0) {
            append_char('0');
            return;
        }
        char buf[12]{};
        int pos = 0;
        while (v > 0) {
            buf[pos++] = static_cast<char>('0' + v % 10);
            v /= 10;
        }
        for (int i = pos - 1; i >= 0; --i)
            append_char(buf[i]);
    }

    consteval bool operator==(const char* s) const {
        for (std::size_t i = 0; i < len; ++i)
            if (data[i] != s[i])
                return false;
        return s[len] == '\0';
    }
};

template <std::size_t N> FixedString(const char (&)[N]) -> FixedString<N>;

} // namespace shapetype

#endif // SHAPETYPE_STR_UTILS_HPP
