#pragma once

#include <stdexcept>
#include <string>

#include "primitive.hpp"

namespace bounded {

/// \brief Rejection of a value outside of a half-open range <tt>[lower, upper)</tt>.
template<primitive T>
class OutOfBounds : public std::out_of_range {
private:
    T lower_, upper_, given_;

public:
    inline OutOfBounds(T const lower, T const upper, T const given)
        : std::out_of_range("the value " + to_string(given) + " is not in the half-open range ["
            + to_string(lower) + ", " + to_string(upper) + ")"),
          lower_(lower), upper_(upper), given_(given) {
    }

    inline T lower() const { return lower_; }
    inline T upper() const { return upper_; }
    inline T given() const { return given_; }

    inline bool operator==(OutOfBounds const& other) const {
        return lower_ == other.lower_ && upper_ == other.upper_ && given_ == other.given_;
    }
};

/// \brief Rejection of a value below the lower bound of a range <tt>[lower, +inf)</tt>.
template<primitive T>
class OutOfBoundsFrom : public std::out_of_range {
private:
    T lower_, given_;

public:
    inline OutOfBoundsFrom(T const lower, T const given)
        : std::out_of_range("the value " + to_string(given) + " is not in the lower-only range ["
            + to_string(lower) + ", +inf)"),
          lower_(lower), given_(given) {
    }

    inline T lower() const { return lower_; }
    inline T given() const { return given_; }

    inline bool operator==(OutOfBoundsFrom const& other) const {
        return lower_ == other.lower_ && given_ == other.given_;
    }
};

/// \brief Rejection of a value outside of an inclusive range <tt>[lower, upper]</tt>.
template<primitive T>
class OutOfBoundsInclusive : public std::out_of_range {
private:
    T lower_, upper_, given_;

public:
    inline OutOfBoundsInclusive(T const lower, T const upper, T const given)
        : std::out_of_range("the value " + to_string(given) + " is not in the inclusive range ["
            + to_string(lower) + ", " + to_string(upper) + "]"),
          lower_(lower), upper_(upper), given_(given) {
    }

    inline T lower() const { return lower_; }
    inline T upper() const { return upper_; }
    inline T given() const { return given_; }

    inline bool operator==(OutOfBoundsInclusive const& other) const {
        return lower_ == other.lower_ && upper_ == other.upper_ && given_ == other.given_;
    }
};

/// \brief Rejection of a value not below the upper bound of a range <tt>(-inf, upper)</tt>.
template<primitive T>
class OutOfBoundsTo : public std::out_of_range {
private:
    T upper_, given_;

public:
    inline OutOfBoundsTo(T const upper, T const given)
        : std::out_of_range("the value " + to_string(given) + " is not in the upper-open range (-inf, "
            + to_string(upper) + ")"),
          upper_(upper), given_(given) {
    }

    inline T upper() const { return upper_; }
    inline T given() const { return given_; }

    inline bool operator==(OutOfBoundsTo const& other) const {
        return upper_ == other.upper_ && given_ == other.given_;
    }
};

/// \brief Rejection of a value above the upper bound of a range <tt>(-inf, upper]</tt>.
template<primitive T>
class OutOfBoundsToInclusive : public std::out_of_range {
private:
    T upper_, given_;

public:
    inline OutOfBoundsToInclusive(T const upper, T const given)
        : std::out_of_range("the value " + to_string(given) + " is not in the upper-inclusive range (-inf, "
            + to_string(upper) + "]"),
          upper_(upper), given_(given) {
    }

    inline T upper() const { return upper_; }
    inline T given() const { return given_; }

    inline bool operator==(OutOfBoundsToInclusive const& other) const {
        return upper_ == other.upper_ && given_ == other.given_;
    }
};

}
