#pragma once

#include <ostream>
#include <sstream>
#include <string>

#include "error.hpp"
#include "primitive.hpp"
#include "shapes.hpp"

namespace bounded {

/// \brief The suffix that names a shape in type labels, e.g. \c Inclusive in \c BoundedU8Inclusive.
constexpr char const* shape_suffix(Shape const shape) {
    switch(shape) {
        case Shape::half_open:    return "";
        case Shape::from:         return "From";
        case Shape::inclusive:    return "Inclusive";
        case Shape::to:           return "To";
        case Shape::to_inclusive: return "ToInclusive";
    }
    return "";
}

/// \brief The bare label of a bounded type, including its bounds, e.g. <tt>BoundedU8<10, 20></tt>.
///
/// The label is composed from the type's compile-time constants, so two types that differ only in their
/// bounds always have different labels.
template<bounded_value B>
std::string label() {
    using T = typename B::Primitive;

    std::ostringstream oss;
    oss << "Bounded" << width_label<T>() << shape_suffix(B::shape) << "<";
    if constexpr(B::shape == Shape::half_open || B::shape == Shape::inclusive) {
        oss << to_string(B::lower) << ", " << to_string(B::upper);
    } else if constexpr(B::shape == Shape::from) {
        oss << to_string(B::lower);
    } else {
        oss << to_string(B::upper);
    }
    oss << ">";
    return oss.str();
}

/// \brief Renders a bounded value along with its type label, e.g. <tt>BoundedU8<10, 20>(15)</tt>.
template<bounded_value B>
std::string debug(B const& b) {
    return label<B>() + "(" + to_string(b.unwrap()) + ")";
}

/// \brief Renders the plain value of a bounded value.
template<bounded_value B>
std::string display(B const& b) {
    return to_string(b.unwrap());
}

template<primitive T>
std::string debug(OutOfBounds<T> const& e) {
    std::ostringstream oss;
    oss << "OutOfBounds<" << width_label<T>() << "> { lower: " << to_string(e.lower())
        << ", upper: " << to_string(e.upper()) << ", given: " << to_string(e.given()) << " }";
    return oss.str();
}

template<primitive T>
std::string debug(OutOfBoundsFrom<T> const& e) {
    std::ostringstream oss;
    oss << "OutOfBoundsFrom<" << width_label<T>() << "> { lower: " << to_string(e.lower())
        << ", given: " << to_string(e.given()) << " }";
    return oss.str();
}

template<primitive T>
std::string debug(OutOfBoundsInclusive<T> const& e) {
    std::ostringstream oss;
    oss << "OutOfBoundsInclusive<" << width_label<T>() << "> { lower: " << to_string(e.lower())
        << ", upper: " << to_string(e.upper()) << ", given: " << to_string(e.given()) << " }";
    return oss.str();
}

template<primitive T>
std::string debug(OutOfBoundsTo<T> const& e) {
    std::ostringstream oss;
    oss << "OutOfBoundsTo<" << width_label<T>() << "> { upper: " << to_string(e.upper())
        << ", given: " << to_string(e.given()) << " }";
    return oss.str();
}

template<primitive T>
std::string debug(OutOfBoundsToInclusive<T> const& e) {
    std::ostringstream oss;
    oss << "OutOfBoundsToInclusive<" << width_label<T>() << "> { upper: " << to_string(e.upper())
        << ", given: " << to_string(e.given()) << " }";
    return oss.str();
}

/// \brief The sentence describing a rejection, naming the violated range.
inline std::string display(std::out_of_range const& e) {
    return e.what();
}

template<bounded_value B>
std::ostream& operator<<(std::ostream& out, B const& b) {
    return out << display(b);
}

template<primitive T>
std::ostream& operator<<(std::ostream& out, OutOfBounds<T> const& e) { return out << e.what(); }

template<primitive T>
std::ostream& operator<<(std::ostream& out, OutOfBoundsFrom<T> const& e) { return out << e.what(); }

template<primitive T>
std::ostream& operator<<(std::ostream& out, OutOfBoundsInclusive<T> const& e) { return out << e.what(); }

template<primitive T>
std::ostream& operator<<(std::ostream& out, OutOfBoundsTo<T> const& e) { return out << e.what(); }

template<primitive T>
std::ostream& operator<<(std::ostream& out, OutOfBoundsToInclusive<T> const& e) { return out << e.what(); }

}
