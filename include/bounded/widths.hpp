#pragma once

#include <cstddef>
#include <cstdint>

#include "primitive.hpp"
#include "shapes.hpp"

namespace bounded {

// one alias per shape and width, e.g. BoundedU8<10, 20> or BoundedI64ToInclusive<0>
#define BOUNDED_DEFINE_WIDTH(name, T)                                                    \
    template<T Lower, T Upper> using Bounded##name = Bounded<T, Lower, Upper>;            \
    template<T Lower> using Bounded##name##From = BoundedFrom<T, Lower>;                  \
    template<T Lower, T Upper> using Bounded##name##Inclusive = BoundedInclusive<T, Lower, Upper>; \
    template<T Upper> using Bounded##name##To = BoundedTo<T, Upper>;                      \
    template<T Upper> using Bounded##name##ToInclusive = BoundedToInclusive<T, Upper>;

BOUNDED_DEFINE_WIDTH(U8, uint8_t)
BOUNDED_DEFINE_WIDTH(U16, uint16_t)
BOUNDED_DEFINE_WIDTH(U32, uint32_t)
BOUNDED_DEFINE_WIDTH(U64, uint64_t)
BOUNDED_DEFINE_WIDTH(U128, uint128_t)
BOUNDED_DEFINE_WIDTH(Usize, size_t)

BOUNDED_DEFINE_WIDTH(I8, int8_t)
BOUNDED_DEFINE_WIDTH(I16, int16_t)
BOUNDED_DEFINE_WIDTH(I32, int32_t)
BOUNDED_DEFINE_WIDTH(I64, int64_t)
BOUNDED_DEFINE_WIDTH(I128, int128_t)
BOUNDED_DEFINE_WIDTH(Isize, ptrdiff_t)

#undef BOUNDED_DEFINE_WIDTH

}
