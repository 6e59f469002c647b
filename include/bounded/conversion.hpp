#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

namespace bounded {

/// \brief The outcome of a fallible conversion: either the converted value or the record describing its rejection.
template<typename Value, typename Error>
class Conversion {
private:
    std::variant<Value, Error> outcome_;

public:
    inline Conversion(Value const& value) : outcome_(std::in_place_index<0>, value) {
    }

    inline Conversion(Error&& error) : outcome_(std::in_place_index<1>, std::move(error)) {
    }

    Conversion(Conversion const&) = default;
    Conversion(Conversion&&) = default;
    Conversion& operator=(Conversion const&) = default;
    Conversion& operator=(Conversion&&) = default;

    inline bool ok() const { return outcome_.index() == 0; }
    inline explicit operator bool() const { return ok(); }

    /// \brief Reports the converted value.
    ///
    /// Throws the rejection record if the conversion failed.
    inline Value const& value() const {
        if(!ok()) throw std::get<1>(outcome_);
        return std::get<0>(outcome_);
    }

    inline Value value_or(Value const& fallback) const {
        return ok() ? std::get<0>(outcome_) : fallback;
    }

    /// \brief Reports the rejection record.
    ///
    /// Throws \c std::logic_error if the conversion succeeded.
    inline Error const& error() const {
        if(ok()) throw std::logic_error("the conversion succeeded and has no error");
        return std::get<1>(outcome_);
    }
};

}
