#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

#include <decfix/core/detail/int_ops.hpp>
#include <decfix/core/traits.hpp>

namespace decfix::util {

// Uniform over every inner bit pattern, bounds included.
template <typename Fixed>
inline Fixed random_fixed(std::mt19937_64& generator) {
    static_assert(decfix::core::is_fixed_point_v<Fixed>, "random_fixed requires a fixed-point type");
    using unsigned_type = typename Fixed::unsigned_type;
    unsigned_type bits = 0;
    for (std::size_t filled = 0; filled < sizeof(unsigned_type); filled += 8) {
        bits = static_cast<unsigned_type>(
            (static_cast<decfix::core::detail::uint128>(bits) << 32 << 32) | generator());
    }
    return Fixed::from_inner(static_cast<typename Fixed::inner_type>(bits));
}

// Whole part in [-whole_limit, whole_limit] plus a random fraction.
template <typename Fixed>
inline Fixed random_fixed_bounded(std::mt19937_64& generator, std::int64_t whole_limit) {
    static_assert(decfix::core::is_fixed_point_v<Fixed>, "random_fixed_bounded requires a fixed-point type");
    using inner_type = typename Fixed::inner_type;
    // Larger whole parts, plus a full fraction, would overflow the inner type.
    const auto max_whole = decfix::core::detail::saturating_cast<std::int64_t>(
        (decfix::core::detail::integer_limits<inner_type>::max() - (Fixed::DIV - 1)) / Fixed::DIV);
    if (whole_limit < 0) {
        whole_limit = 0;
    }
    if (whole_limit > max_whole) {
        whole_limit = max_whole;
    }
    std::uniform_int_distribution<std::int64_t> whole_dist(-whole_limit, whole_limit);
    std::uniform_int_distribution<std::int64_t> fraction_dist(
        0, static_cast<std::int64_t>(Fixed::DIV) - 1);
    const auto whole = static_cast<inner_type>(whole_dist(generator));
    auto fraction = static_cast<inner_type>(fraction_dist(generator));
    if (whole < 0) {
        fraction = -fraction;
    }
    return Fixed::from_inner(static_cast<inner_type>(whole * Fixed::DIV + fraction));
}

} // namespace decfix::util
