// include/decfix/core/traits.hpp — Compile-time traits for fixed-point families and ratios.

#pragma once

#include <cstddef>
#include <type_traits>

#include <decfix/core/fixed_point.hpp>
#include <decfix/core/per_thing.hpp>

namespace decfix::core {

    template <typename T> struct is_fixed_point : std::false_type {};

    template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
              std::size_t Precision>
    struct is_fixed_point<fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>>
        : std::true_type {};

    template <typename T> inline constexpr bool is_fixed_point_v = is_fixed_point<T>::value;

    template <typename T>
    inline constexpr bool is_decimal_numeric_v = is_fixed_point_v<T> || is_per_thing_v<T>;

} // namespace decfix::core
