#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

#include <bounded/bounded.hpp>

using namespace bounded;

#define BOUNDED_WIDTHS uint8_t, uint16_t, uint32_t, uint64_t, uint128_t, size_t, \
                       int8_t, int16_t, int32_t, int64_t, int128_t, ptrdiff_t

template<typename B, typename U>
concept converts_from = requires(U const x) { B::try_from(x); };

template<typename B, typename U>
concept throws_from = requires(U const x) { B::from(x); };

TEST_SUITE("shapes") {
    TEST_CASE("half_open") {
        using B = BoundedU8<10, 20>;

        REQUIRE(!B::try_from(uint8_t(9)));
        REQUIRE(B::try_from(uint8_t(10)));
        REQUIRE(B::try_from(uint8_t(11)));
        REQUIRE(B::try_from(uint8_t(19)));
        REQUIRE(!B::try_from(uint8_t(20)));
        REQUIRE(!B::try_from(uint8_t(21)));

        REQUIRE(B::try_from(uint8_t(9)).error() == OutOfBounds<uint8_t>(10, 20, 9));
        REQUIRE(B::try_from(uint8_t(20)).error() == OutOfBounds<uint8_t>(10, 20, 20));
    }

    TEST_CASE("from") {
        using B = BoundedU8From<10>;

        REQUIRE(!B::try_from(uint8_t(9)));
        REQUIRE(B::try_from(uint8_t(10)));
        REQUIRE(B::try_from(uint8_t(11)));
        REQUIRE(B::try_from(uint8_t(255)));

        auto const e = B::try_from(uint8_t(9)).error();
        REQUIRE(e.lower() == 10);
        REQUIRE(e.given() == 9);
    }

    TEST_CASE("inclusive") {
        using B = BoundedU8Inclusive<10, 20>;

        REQUIRE(!B::try_from(uint8_t(9)));
        REQUIRE(B::try_from(uint8_t(10)));
        REQUIRE(B::try_from(uint8_t(11)));
        REQUIRE(B::try_from(uint8_t(19)));
        REQUIRE(B::try_from(uint8_t(20)));
        REQUIRE(!B::try_from(uint8_t(21)));

        auto const e = B::try_from(uint8_t(21)).error();
        REQUIRE(e.lower() == 10);
        REQUIRE(e.upper() == 20);
        REQUIRE(e.given() == 21);
    }

    TEST_CASE("to") {
        using B = BoundedU8To<10>;

        REQUIRE(B::try_from(uint8_t(0)));
        REQUIRE(B::try_from(uint8_t(9)));
        REQUIRE(!B::try_from(uint8_t(10)));
        REQUIRE(!B::try_from(uint8_t(11)));

        auto const e = B::try_from(uint8_t(10)).error();
        REQUIRE(e.upper() == 10);
        REQUIRE(e.given() == 10);
    }

    TEST_CASE("to_inclusive") {
        using B = BoundedU8ToInclusive<10>;

        REQUIRE(B::try_from(uint8_t(9)));
        REQUIRE(B::try_from(uint8_t(10)));
        REQUIRE(!B::try_from(uint8_t(11)));

        auto const e = B::try_from(uint8_t(11)).error();
        REQUIRE(e.upper() == 10);
        REQUIRE(e.given() == 11);
    }

    TEST_CASE("signed") {
        using B = BoundedI32<-5, 5>;
        REQUIRE(!B::try_from(-6));
        REQUIRE(B::try_from(-5));
        REQUIRE(B::try_from(0));
        REQUIRE(B::try_from(4));
        REQUIRE(!B::try_from(5));

        using T = BoundedI64ToInclusive<-1>;
        REQUIRE(T::try_from(int64_t(INT64_MIN)));
        REQUIRE(T::try_from(int64_t(-1)));
        REQUIRE(!T::try_from(int64_t(0)));
    }

    TEST_CASE("extremes") {
        using Full = BoundedU8Inclusive<0, 255>;
        for(unsigned x = 0; x <= 255; x++) {
            REQUIRE(Full::try_from(uint8_t(x)));
        }

        using Min = BoundedI64From<INT64_MIN>;
        REQUIRE(Min::try_from(int64_t(INT64_MIN)));
        REQUIRE(Min::try_from(int64_t(INT64_MAX)));

        // the maximum itself is never in a half-open range
        using Max = BoundedU64<0, UINT64_MAX>;
        REQUIRE(Max::try_from(uint64_t(UINT64_MAX - 1)));
        REQUIRE(!Max::try_from(uint64_t(UINT64_MAX)));
    }

    TEST_CASE("exact_width") {
        // a candidate of another integer type is never narrowed into the range
        static_assert(converts_from<BoundedU8<10, 20>, uint8_t>);
        static_assert(!converts_from<BoundedU8<10, 20>, int>);
        static_assert(!converts_from<BoundedU8<10, 20>, uint16_t>);
        static_assert(!converts_from<BoundedI8From<0>, long>);
        static_assert(!converts_from<BoundedU32Inclusive<0, 100>, int32_t>);
        static_assert(!converts_from<BoundedI64To<0>, uint64_t>);
        static_assert(!converts_from<BoundedU128ToInclusive<10>, uint64_t>);

        static_assert(throws_from<BoundedU8Inclusive<0, 100>, uint8_t>);
        static_assert(!throws_from<BoundedU8Inclusive<0, 100>, int>);
        static_assert(!throws_from<BoundedI16<-1, 1>, int>);
    }

    TEST_CASE("mixed_equality") {
        auto const b = BoundedU8Inclusive<0, 100>::from(uint8_t(44));

        // 300 and -212 both wrap to 44 in 8 bits, but are different values
        int const wide = 300;
        int const negative = -212;
        REQUIRE(!(b == wide));
        REQUIRE(!(b == negative));
        REQUIRE(b != 300);
        REQUIRE(b != -212);
        REQUIRE(b == 44);
        REQUIRE(b == 44L);
        REQUIRE(b == uint64_t(44));

        auto const s = BoundedI8From<-100>::from(int8_t(-1));
        REQUIRE(s == -1);
        REQUIRE(s != UINT64_MAX);
        REQUIRE(s != uint8_t(255));
    }

    TEST_CASE_TEMPLATE("roundtrip", T, BOUNDED_WIDTHS) {
        constexpr T lo = 10;
        constexpr T hi = 100;

        for(T x = lo + 1; x < hi; x++) {
            REQUIRE(Bounded<T, lo, hi>::try_from(x).value().unwrap() == x);
            REQUIRE(BoundedFrom<T, lo>::try_from(x).value().unwrap() == x);
            REQUIRE(BoundedInclusive<T, lo, hi>::try_from(x).value().unwrap() == x);
            REQUIRE(BoundedTo<T, hi>::try_from(x).value().unwrap() == x);
            REQUIRE(BoundedToInclusive<T, hi>::try_from(x).value().unwrap() == x);
        }
    }

    TEST_CASE_TEMPLATE("boundaries", T, BOUNDED_WIDTHS) {
        constexpr T lo = 10;
        constexpr T hi = 20;

        REQUIRE(!Bounded<T, lo, hi>::try_from(T(lo - 1)));
        REQUIRE(Bounded<T, lo, hi>::try_from(lo));
        REQUIRE(!Bounded<T, lo, hi>::try_from(hi));

        REQUIRE(!BoundedInclusive<T, lo, hi>::try_from(T(lo - 1)));
        REQUIRE(BoundedInclusive<T, lo, hi>::try_from(hi));
        REQUIRE(!BoundedInclusive<T, lo, hi>::try_from(T(hi + 1)));

        REQUIRE(!BoundedFrom<T, lo>::try_from(T(lo - 1)));
        REQUIRE(BoundedFrom<T, lo>::try_from(lo));

        REQUIRE(BoundedTo<T, hi>::try_from(T(hi - 1)));
        REQUIRE(!BoundedTo<T, hi>::try_from(hi));

        REQUIRE(BoundedToInclusive<T, hi>::try_from(hi));
        REQUIRE(!BoundedToInclusive<T, hi>::try_from(T(hi + 1)));
    }

    TEST_CASE_TEMPLATE("layout", T, BOUNDED_WIDTHS) {
        static_assert(sizeof(Bounded<T, 0, 1>) == sizeof(T));
        static_assert(sizeof(BoundedFrom<T, 0>) == sizeof(T));
        static_assert(sizeof(BoundedInclusive<T, 0, 0>) == sizeof(T));
        static_assert(sizeof(BoundedTo<T, 1>) == sizeof(T));
        static_assert(sizeof(BoundedToInclusive<T, 0>) == sizeof(T));
        static_assert(std::is_trivially_copyable_v<Bounded<T, 0, 1>>);
        static_assert(!std::is_default_constructible_v<Bounded<T, 0, 1>>);
        static_assert(!std::is_constructible_v<Bounded<T, 0, 1>, T>);
    }

    TEST_CASE("aliases") {
        static_assert(std::is_same_v<BoundedU8<1, 2>, Bounded<uint8_t, 1, 2>>);
        static_assert(std::is_same_v<BoundedI128From<-1>, BoundedFrom<int128_t, -1>>);
        static_assert(std::is_same_v<BoundedUsizeInclusive<1, 2>, BoundedInclusive<size_t, 1, 2>>);
        static_assert(std::is_same_v<BoundedIsizeTo<0>, BoundedTo<ptrdiff_t, 0>>);
        static_assert(std::is_same_v<BoundedU16ToInclusive<9>, BoundedToInclusive<uint16_t, 9>>);

        // same width, different bounds
        static_assert(!std::is_same_v<BoundedU8<5, 10>, BoundedU8<0, 100>>);
    }

    TEST_CASE("equality") {
        using B = BoundedI16<-100, 100>;
        auto const b = B::from(int16_t(42));

        REQUIRE(b == 42);
        REQUIRE(42 == b);
        REQUIRE(b != 43);
        REQUIRE(b == B::from(int16_t(42)));
        REQUIRE(b != B::from(int16_t(-42)));

        REQUIRE(B::from(int16_t(-1)) < B::from(int16_t(1)));
        REQUIRE(B::from(int16_t(99)) > B::from(int16_t(-100)));
    }

    TEST_CASE("unwrap") {
        auto const b = BoundedU32From<1000>::from(uint32_t(4096));
        uint32_t const x = b.unwrap();
        REQUIRE(x == 4096);
        REQUIRE(static_cast<uint32_t>(b) == 4096);
    }

    TEST_CASE("from_throws") {
        using B = BoundedU8Inclusive<1, 12>;
        REQUIRE(B::from(uint8_t(12)) == 12);
        REQUIRE_THROWS_AS(B::from(uint8_t(13)), OutOfBoundsInclusive<uint8_t>);
        REQUIRE_THROWS_AS(B::from(uint8_t(0)), std::out_of_range);
    }

    TEST_CASE("conversion") {
        using B = BoundedI8To<0>;
        auto const fallback = B::from(int8_t(-100));

        auto const ok = B::try_from(int8_t(-1));
        REQUIRE(ok.ok());
        REQUIRE(bool(ok));
        REQUIRE_NOTHROW(ok.value());
        REQUIRE_THROWS_AS(ok.error(), std::logic_error);
        REQUIRE(ok.value_or(fallback) == -1);

        auto const bad = B::try_from(int8_t(0));
        REQUIRE(!bad.ok());
        REQUIRE_THROWS_AS(bad.value(), OutOfBoundsTo<int8_t>);
        REQUIRE(bad.value_or(fallback) == -100);
        REQUIRE(bad.error() == OutOfBoundsTo<int8_t>(0, 0));
    }

    TEST_CASE("copy") {
        using B = BoundedU64<1, 1000>;
        auto a = B::from(uint64_t(1));
        auto const b = B::from(uint64_t(999));
        REQUIRE(a == 1);
        a = b;
        REQUIRE(a == 999);
        REQUIRE(a == b);
    }
}
