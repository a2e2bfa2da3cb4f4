// include/decfix/core/wide.hpp — 256-bit intermediate product and the scaled multiply-divide primitive.

#pragma once

#include <optional>
#include <utility>

#include <decfix/core/detail/int_ops.hpp>

namespace decfix::core {

using detail::uint128;

// Full 256-bit product of two 128-bit magnitudes as {high, low}.
constexpr std::pair<uint128, uint128> mul_wide(uint128 lhs, uint128 rhs) noexcept {
    constexpr uint128 LOW_MASK = (uint128{1} << 64) - 1;
    const uint128 lhs_low = lhs & LOW_MASK;
    const uint128 lhs_high = lhs >> 64;
    const uint128 rhs_low = rhs & LOW_MASK;
    const uint128 rhs_high = rhs >> 64;

    const uint128 low_low = lhs_low * rhs_low;
    const uint128 high_low = lhs_high * rhs_low;
    const uint128 low_high = lhs_low * rhs_high;
    const uint128 high_high = lhs_high * rhs_high;

    // (2^64 - 1) * 2 + (2^64 - 1)^2 == 2^128 - 1, so the middle column cannot wrap.
    const uint128 cross = (low_low >> 64) + (high_low & LOW_MASK) + low_high;
    const uint128 high = high_high + (high_low >> 64) + (cross >> 64);
    const uint128 low = (cross << 64) | (low_low & LOW_MASK);
    return {high, low};
}

/// Computes floor(a * b / c) without losing the upper half of the product.
///
/// Empty when `c` is zero or the quotient needs more than 128 bits. Every
/// multiply and divide of the fixed-point kernel funnels its magnitudes
/// through here, so the result is exact for any pair of 128-bit operands.
constexpr std::optional<uint128> scaled_multiply_divide(uint128 a, uint128 b, uint128 c) noexcept {
    if (c == 0) {
        return std::nullopt;
    }
    const auto [high, low] = mul_wide(a, b);
    if (high == 0) {
        return low / c;
    }
    if (high >= c) {
        return std::nullopt;
    }
    uint128 remainder = high;
    uint128 quotient = 0;
    for (int bit = 127; bit >= 0; --bit) {
        const bool carry = (remainder >> 127) != 0;
        remainder = (remainder << 1) | ((low >> bit) & 1);
        quotient <<= 1;
        if (carry || remainder >= c) {
            remainder -= c;
            quotient |= 1;
        }
    }
    return quotient;
}

} // namespace decfix::core
