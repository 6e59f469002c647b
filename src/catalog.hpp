#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <bounded/bounded.hpp>

struct Verdict {
    enum Kind { accepted, rejected, invalid };

    Kind kind;
    std::string text;
};

// parse a decimal integer and run it through the conversion of B
template<bounded::bounded_value B>
Verdict classify(std::string_view const input) {
    using T = typename B::Primitive;

    intmax_t x;
    auto const end = input.data() + input.size();
    auto const [ptr, ec] = std::from_chars(input.data(), end, x);
    if(ec == std::errc::result_out_of_range) {
        return { Verdict::invalid, "not representable as " + std::string(bounded::width_label<T>()) };
    } else if(ec != std::errc() || ptr != end) {
        return { Verdict::invalid, "not an integer" };
    }

    if(!std::in_range<T>(x)) {
        return { Verdict::invalid, "not representable as " + std::string(bounded::width_label<T>()) };
    }

    auto const r = B::try_from(T(x));
    if(r) {
        return { Verdict::accepted, bounded::debug(r.value()) };
    } else {
        return { Verdict::rejected, bounded::display(r.error()) };
    }
}

struct CatalogEntry {
    std::string name;
    std::string label;
    Verdict (*classify)(std::string_view);
};

template<bounded::bounded_value B>
CatalogEntry catalog_entry(std::string&& name) {
    return CatalogEntry { std::move(name), bounded::label<B>(), &classify<B> };
}

inline std::vector<CatalogEntry> const& catalog() {
    using namespace bounded;
    static std::vector<CatalogEntry> const entries = {
        catalog_entry<BoundedU8Inclusive<0, 100>>("percent"),
        catalog_entry<BoundedU16Inclusive<1, 65535>>("port"),
        catalog_entry<BoundedU8Inclusive<1, 12>>("month"),
        catalog_entry<BoundedU8<0, 7>>("weekday"),
        catalog_entry<BoundedU8<0, 24>>("hour"),
        catalog_entry<BoundedI16From<-273>>("celsius"),
        catalog_entry<BoundedI32<0, 256>>("exit-code"),
        catalog_entry<BoundedI8Inclusive<-20, 19>>("nice"),
        catalog_entry<BoundedI32ToInclusive<4096>>("backlog"),
        catalog_entry<BoundedI32To<65>>("signal"),
    };
    return entries;
}

inline CatalogEntry const* find_catalog_entry(std::string_view const name) {
    for(auto const& e : catalog()) {
        if(e.name == name) return &e;
    }
    return nullptr;
}
