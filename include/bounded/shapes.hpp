#pragma once

#include <compare>

#include "check.hpp"
#include "conversion.hpp"
#include "error.hpp"
#include "primitive.hpp"

namespace bounded {

/// \brief An integer in the half-open range <tt>[Lower, Upper)</tt>.
///
/// Values can only be obtained via \ref try_from or \ref from, which check the range once.
/// Both accept only a \c T; passing any other integer type does not compile.
/// The object is exactly as large as the wrapped primitive.
template<primitive T, T Lower, T Upper>
requires half_open_bounds<T, Lower, Upper>
class Bounded {
public:
    using Primitive = T;
    using Error = OutOfBounds<T>;

    static constexpr Shape shape = Shape::half_open;
    static constexpr T lower = Lower;
    static constexpr T upper = Upper;

    static constexpr bool contains(std::same_as<T> auto const x) { return in_half_open(Lower, Upper, x); }

private:
    friend class Validator;

    T value_;

    inline constexpr explicit Bounded(T const x) : value_(x) {
    }

    inline static Error reject(T const x) { return Error(Lower, Upper, x); }

public:
    inline static Conversion<Bounded, Error> try_from(std::same_as<T> auto const x) {
        return Validator::convert<Bounded>(x);
    }

    /// \brief Converts the given value, throwing an \ref OutOfBounds if it is not in range.
    inline static Bounded from(std::same_as<T> auto const x) {
        return try_from(x).value();
    }

    Bounded(Bounded const&) = default;
    Bounded& operator=(Bounded const&) = default;

    inline constexpr T unwrap() const { return value_; }
    inline constexpr explicit operator T() const { return value_; }

    template<primitive U>
    inline constexpr bool operator==(U const x) const { return cmp_equal(value_, x); }
    bool operator==(Bounded const&) const = default;
    auto operator<=>(Bounded const&) const = default;
};

/// \brief An integer bounded only below, in the range <tt>[Lower, +inf)</tt>.
template<primitive T, T Lower>
class BoundedFrom {
public:
    using Primitive = T;
    using Error = OutOfBoundsFrom<T>;

    static constexpr Shape shape = Shape::from;
    static constexpr T lower = Lower;

    static constexpr bool contains(std::same_as<T> auto const x) { return in_from(Lower, x); }

private:
    friend class Validator;

    T value_;

    inline constexpr explicit BoundedFrom(T const x) : value_(x) {
    }

    inline static Error reject(T const x) { return Error(Lower, x); }

public:
    inline static Conversion<BoundedFrom, Error> try_from(std::same_as<T> auto const x) {
        return Validator::convert<BoundedFrom>(x);
    }

    inline static BoundedFrom from(std::same_as<T> auto const x) {
        return try_from(x).value();
    }

    BoundedFrom(BoundedFrom const&) = default;
    BoundedFrom& operator=(BoundedFrom const&) = default;

    inline constexpr T unwrap() const { return value_; }
    inline constexpr explicit operator T() const { return value_; }

    template<primitive U>
    inline constexpr bool operator==(U const x) const { return cmp_equal(value_, x); }
    bool operator==(BoundedFrom const&) const = default;
    auto operator<=>(BoundedFrom const&) const = default;
};

/// \brief An integer in the inclusive range <tt>[Lower, Upper]</tt>.
template<primitive T, T Lower, T Upper>
requires inclusive_bounds<T, Lower, Upper>
class BoundedInclusive {
public:
    using Primitive = T;
    using Error = OutOfBoundsInclusive<T>;

    static constexpr Shape shape = Shape::inclusive;
    static constexpr T lower = Lower;
    static constexpr T upper = Upper;

    static constexpr bool contains(std::same_as<T> auto const x) { return in_inclusive(Lower, Upper, x); }

private:
    friend class Validator;

    T value_;

    inline constexpr explicit BoundedInclusive(T const x) : value_(x) {
    }

    inline static Error reject(T const x) { return Error(Lower, Upper, x); }

public:
    inline static Conversion<BoundedInclusive, Error> try_from(std::same_as<T> auto const x) {
        return Validator::convert<BoundedInclusive>(x);
    }

    inline static BoundedInclusive from(std::same_as<T> auto const x) {
        return try_from(x).value();
    }

    BoundedInclusive(BoundedInclusive const&) = default;
    BoundedInclusive& operator=(BoundedInclusive const&) = default;

    inline constexpr T unwrap() const { return value_; }
    inline constexpr explicit operator T() const { return value_; }

    template<primitive U>
    inline constexpr bool operator==(U const x) const { return cmp_equal(value_, x); }
    bool operator==(BoundedInclusive const&) const = default;
    auto operator<=>(BoundedInclusive const&) const = default;
};

/// \brief An integer bounded only above, in the range <tt>(-inf, Upper)</tt>.
template<primitive T, T Upper>
class BoundedTo {
public:
    using Primitive = T;
    using Error = OutOfBoundsTo<T>;

    static constexpr Shape shape = Shape::to;
    static constexpr T upper = Upper;

    static constexpr bool contains(std::same_as<T> auto const x) { return in_to(Upper, x); }

private:
    friend class Validator;

    T value_;

    inline constexpr explicit BoundedTo(T const x) : value_(x) {
    }

    inline static Error reject(T const x) { return Error(Upper, x); }

public:
    inline static Conversion<BoundedTo, Error> try_from(std::same_as<T> auto const x) {
        return Validator::convert<BoundedTo>(x);
    }

    inline static BoundedTo from(std::same_as<T> auto const x) {
        return try_from(x).value();
    }

    BoundedTo(BoundedTo const&) = default;
    BoundedTo& operator=(BoundedTo const&) = default;

    inline constexpr T unwrap() const { return value_; }
    inline constexpr explicit operator T() const { return value_; }

    template<primitive U>
    inline constexpr bool operator==(U const x) const { return cmp_equal(value_, x); }
    bool operator==(BoundedTo const&) const = default;
    auto operator<=>(BoundedTo const&) const = default;
};

/// \brief An integer bounded only above, in the range <tt>(-inf, Upper]</tt>.
template<primitive T, T Upper>
class BoundedToInclusive {
public:
    using Primitive = T;
    using Error = OutOfBoundsToInclusive<T>;

    static constexpr Shape shape = Shape::to_inclusive;
    static constexpr T upper = Upper;

    static constexpr bool contains(std::same_as<T> auto const x) { return in_to_inclusive(Upper, x); }

private:
    friend class Validator;

    T value_;

    inline constexpr explicit BoundedToInclusive(T const x) : value_(x) {
    }

    inline static Error reject(T const x) { return Error(Upper, x); }

public:
    inline static Conversion<BoundedToInclusive, Error> try_from(std::same_as<T> auto const x) {
        return Validator::convert<BoundedToInclusive>(x);
    }

    inline static BoundedToInclusive from(std::same_as<T> auto const x) {
        return try_from(x).value();
    }

    BoundedToInclusive(BoundedToInclusive const&) = default;
    BoundedToInclusive& operator=(BoundedToInclusive const&) = default;

    inline constexpr T unwrap() const { return value_; }
    inline constexpr explicit operator T() const { return value_; }

    template<primitive U>
    inline constexpr bool operator==(U const x) const { return cmp_equal(value_, x); }
    bool operator==(BoundedToInclusive const&) const = default;
    auto operator<=>(BoundedToInclusive const&) const = default;
};

/// \brief Satisfied by the five bounded shapes.
template<typename B>
concept bounded_value =
    requires {
        typename B::Primitive;
        typename B::Error;
        { B::shape } -> std::convertible_to<Shape>;
    }
    && primitive<typename B::Primitive>
    && requires(B const& b) {
        { b.unwrap() } -> std::same_as<typename B::Primitive>;
    };

}
