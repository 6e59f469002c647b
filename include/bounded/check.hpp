#pragma once

#include "conversion.hpp"
#include "primitive.hpp"

namespace bounded {

/// \brief The five forms a range can take.
enum class Shape {
    half_open,    // [lower, upper)
    from,         // [lower, +inf)
    inclusive,    // [lower, upper]
    to,           // (-inf, upper)
    to_inclusive, // (-inf, upper]
};

template<primitive T>
constexpr bool in_half_open(T const lower, T const upper, T const x) {
    return lower <= x && x < upper;
}

template<primitive T>
constexpr bool in_from(T const lower, T const x) {
    return lower <= x;
}

template<primitive T>
constexpr bool in_inclusive(T const lower, T const upper, T const x) {
    return lower <= x && x <= upper;
}

template<primitive T>
constexpr bool in_to(T const upper, T const x) {
    return x < upper;
}

template<primitive T>
constexpr bool in_to_inclusive(T const upper, T const x) {
    return x <= upper;
}

/// \brief Tests whether a half-open range <tt>[lower, upper)</tt> admits any value at all.
template<primitive T>
constexpr bool ordered_half_open(T const lower, T const upper) {
    return lower < upper;
}

/// \brief Tests whether an inclusive range <tt>[lower, upper]</tt> admits any value at all.
template<primitive T>
constexpr bool ordered_inclusive(T const lower, T const upper) {
    return lower <= upper;
}

template<typename T, T lower, T upper>
concept half_open_bounds = primitive<T> && ordered_half_open(lower, upper);

template<typename T, T lower, T upper>
concept inclusive_bounds = primitive<T> && ordered_inclusive(lower, upper);

/// \brief The single point where bounded values come into existence.
///
/// The bounded types grant the validator access to their unchecked constructors, which it only uses
/// after the type's membership predicate accepted the candidate.
/// Candidates must already have the wrapped width; a wider or differently signed integer is not converted.
class Validator {
public:
    template<typename B>
    static Conversion<B, typename B::Error> convert(std::same_as<typename B::Primitive> auto const x) {
        if(B::contains(x)) {
            return Conversion<B, typename B::Error>(B(x));
        } else {
            return Conversion<B, typename B::Error>(B::reject(x));
        }
    }
};

}
