#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include <ankerl/unordered_dense.h>

#include "primitive.hpp"
#include "shapes.hpp"

namespace bounded {

template<primitive T>
inline uint64_t hash_primitive(T const x) {
    ankerl::unordered_dense::hash<uint64_t> const h;
    if constexpr(sizeof(T) <= sizeof(uint64_t)) {
        return h(uint64_t(x));
    } else {
        // fold the high half into the hash of the low half
        uint64_t const lo = uint64_t(uint128_t(x));
        uint64_t const hi = uint64_t(uint128_t(x) >> 64);
        return h(lo ^ h(hi));
    }
}

/// \brief Hashes bounded values by their wrapped primitive.
struct Hash {
    using is_avalanching = void;

    template<bounded_value B>
    inline uint64_t operator()(B const& b) const noexcept {
        return hash_primitive(b.unwrap());
    }
};

}

template<bounded::primitive T, T Lower, T Upper>
struct std::hash<bounded::Bounded<T, Lower, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Lower>
struct std::hash<bounded::BoundedFrom<T, Lower>> : bounded::Hash {};

template<bounded::primitive T, T Lower, T Upper>
struct std::hash<bounded::BoundedInclusive<T, Lower, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Upper>
struct std::hash<bounded::BoundedTo<T, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Upper>
struct std::hash<bounded::BoundedToInclusive<T, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Lower, T Upper>
struct ankerl::unordered_dense::hash<bounded::Bounded<T, Lower, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Lower>
struct ankerl::unordered_dense::hash<bounded::BoundedFrom<T, Lower>> : bounded::Hash {};

template<bounded::primitive T, T Lower, T Upper>
struct ankerl::unordered_dense::hash<bounded::BoundedInclusive<T, Lower, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Upper>
struct ankerl::unordered_dense::hash<bounded::BoundedTo<T, Upper>> : bounded::Hash {};

template<bounded::primitive T, T Upper>
struct ankerl::unordered_dense::hash<bounded::BoundedToInclusive<T, Upper>> : bounded::Hash {};
