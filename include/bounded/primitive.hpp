#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace bounded {

__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

/// \brief The primitive integer widths a bounded type can wrap.
///
/// Covers the 8, 16, 32, 64 and 128-bit signed and unsigned integers as well as the pointer-sized ones.
/// \c bool and the character types are not considered integers here.
template<typename T>
concept primitive =
    (std::integral<T>
        && !std::same_as<T, bool>
        && !std::same_as<T, char>
        && !std::same_as<T, wchar_t>
        && !std::same_as<T, char8_t>
        && !std::same_as<T, char16_t>
        && !std::same_as<T, char32_t>)
    || std::same_as<T, int128_t>
    || std::same_as<T, uint128_t>;

// std::is_signed does not know __int128 in strict mode
template<primitive T>
inline constexpr bool is_signed_primitive = (T(-1) < T(0));

template<primitive T>
inline constexpr size_t width_bits = sizeof(T) * 8;

/// \brief The short width label of a primitive, e.g. \c U8 or \c I128.
template<primitive T>
constexpr char const* width_label() {
    if constexpr(is_signed_primitive<T>) {
        if constexpr(width_bits<T> == 8) return "I8";
        else if constexpr(width_bits<T> == 16) return "I16";
        else if constexpr(width_bits<T> == 32) return "I32";
        else if constexpr(width_bits<T> == 64) return "I64";
        else return "I128";
    } else {
        if constexpr(width_bits<T> == 8) return "U8";
        else if constexpr(width_bits<T> == 16) return "U16";
        else if constexpr(width_bits<T> == 32) return "U32";
        else if constexpr(width_bits<T> == 64) return "U64";
        else return "U128";
    }
}

/// \brief Compares two primitives of any widths by their mathematical values.
///
/// Unlike the built-in comparison, neither operand is converted to the other's type first.
template<primitive A, primitive B>
constexpr bool cmp_equal(A const a, B const b) {
    if constexpr(is_signed_primitive<A> == is_signed_primitive<B>) {
        if constexpr(is_signed_primitive<A>) {
            return int128_t(a) == int128_t(b);
        } else {
            return uint128_t(a) == uint128_t(b);
        }
    } else if constexpr(is_signed_primitive<A>) {
        return a >= A(0) && uint128_t(a) == uint128_t(b);
    } else {
        return b >= B(0) && uint128_t(a) == uint128_t(b);
    }
}

/// \brief Renders a primitive of any width in decimal.
template<primitive T>
std::string to_string(T const x) {
    if constexpr(sizeof(T) <= sizeof(uintmax_t)) {
        if constexpr(is_signed_primitive<T>) {
            return std::to_string(intmax_t(x));
        } else {
            return std::to_string(uintmax_t(x));
        }
    } else {
        // the magnitude of the minimum is representable unsigned
        bool const negative = is_signed_primitive<T> && x < T(0);
        uint128_t m = negative ? uint128_t(0) - uint128_t(x) : uint128_t(x);

        std::string s;
        do {
            s.push_back(char('0' + int(m % 10)));
            m /= 10;
        } while(m);

        if(negative) s.push_back('-');
        std::reverse(s.begin(), s.end());
        return s;
    }
}

}
