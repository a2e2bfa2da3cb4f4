#pragma once

#include <ostream>
#include <type_traits>

#include <decfix/core/per_thing.hpp>
#include <decfix/core/traits.hpp>
#include <decfix/io/format.hpp>

namespace decfix::util {

template <typename Fixed, typename = std::enable_if_t<decfix::core::is_fixed_point_v<Fixed>>>
inline std::ostream& dump(std::ostream& os, const Fixed& value) {
    return os << "fixed" << Fixed::BITS << '(' << decfix::io::to_string(value) << ')';
}

template <typename Parts, Parts Accuracy>
inline std::ostream& dump(std::ostream& os, const decfix::core::per_thing<Parts, Accuracy>& value) {
    return os << "per_thing(" << static_cast<unsigned long long>(value.deconstruct()) << '/'
              << static_cast<unsigned long long>(Accuracy) << ')';
}

} // namespace decfix::util
