// tests/unit/test_fixed_scaling.cpp — Fixed-point values applied to plain integers of other widths.

#include <cstdint>
#include <iostream>
#include <limits>

#include <decfix/decfix.hpp>

namespace {

using decfix::FixedI128;
using decfix::FixedI32;
using decfix::FixedI64;
using decfix::core::detail::int128;
using decfix::core::detail::uint128;

static_assert(FixedI64::from_rational(3, 2).saturating_mul_int(std::int64_t{10}) == 15);
static_assert(FixedI32::from_integer(10).checked_div_int(4).value() == 2);

bool test_checked_mul_int() {
    std::cerr << "test_checked_mul_int start" << std::endl;
    const auto thousand = FixedI64::from_integer(1000);
    if (thousand.checked_mul_int(std::int64_t{9'000'000'000'000'000}) !=
        std::int64_t{9'000'000'000'000'000'000}) {
        std::cerr << "1000 * 9e15 must use the widened product" << std::endl;
        return false;
    }
    if (thousand.checked_mul_int(std::int64_t{10'000'000'000'000'000})) {
        std::cerr << "1000 * 1e16 overflows int64" << std::endl;
        return false;
    }
    if (FixedI64::from_rational(-3, 2).checked_mul_int(7) != -10) {
        std::cerr << "-1.5 * 7 truncates toward zero" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(-2).checked_mul_int(std::uint32_t{5})) {
        std::cerr << "negative product cannot land in an unsigned type" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(2).checked_mul_int(std::uint64_t{1} << 63)) {
        std::cerr << "operand wider than the inner type is rejected" << std::endl;
        return false;
    }
    if (FixedI32::from_integer(100).checked_mul_int(std::int8_t{2})) {
        std::cerr << "200 does not fit int8" << std::endl;
        return false;
    }
    const auto wide = FixedI32::from_integer(200'000).checked_mul_int(std::int64_t{100'000});
    if (wide != std::int64_t{20'000'000'000}) {
        std::cerr << "narrow family into a wide result" << std::endl;
        return false;
    }
    const int128 min128 = decfix::core::detail::integer_limits<int128>::min();
    if (FixedI128::one().checked_mul_int(min128) != min128) {
        std::cerr << "one * int128 min" << std::endl;
        return false;
    }
    std::cerr << "test_checked_mul_int end" << std::endl;
    return true;
}

bool test_saturating_mul_int() {
    std::cerr << "test_saturating_mul_int start" << std::endl;
    constexpr auto max64 = std::numeric_limits<std::int64_t>::max();
    constexpr auto min64 = std::numeric_limits<std::int64_t>::min();
    const auto thousand = FixedI64::from_integer(1000);
    if (thousand.saturating_mul_int(std::int64_t{10'000'000'000'000'000}) != max64) {
        std::cerr << "positive overflow clamps to max" << std::endl;
        return false;
    }
    if (thousand.saturating_mul_int(std::int64_t{-10'000'000'000'000'000}) != min64) {
        std::cerr << "negative overflow clamps to min" << std::endl;
        return false;
    }
    if ((-thousand).saturating_mul_int(std::int64_t{-10'000'000'000'000'000}) != max64) {
        std::cerr << "two negatives clamp to max" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(-2).saturating_mul_int(std::uint32_t{5}) != 0u) {
        std::cerr << "negative product clamps to zero for unsigned" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(3).saturating_mul_int(std::uint8_t{100}) != 255u) {
        std::cerr << "unsigned positive overflow clamps to max" << std::endl;
        return false;
    }
    if (FixedI64::zero().saturating_mul_int(max64) != 0) {
        std::cerr << "zero times anything" << std::endl;
        return false;
    }
    // Operands that do not fit the 32-bit inner type take the fallback path.
    const std::int64_t beyond_inner = std::int64_t{1} << 40;
    if (FixedI32::zero().saturating_mul_int(-beyond_inner) != max64 ||
        FixedI32::zero().saturating_mul_int(beyond_inner) != max64) {
        std::cerr << "zero with an operand wider than the inner type clamps to max" << std::endl;
        return false;
    }
    if (FixedI32::from_integer(-1).saturating_mul_int(beyond_inner) != min64) {
        std::cerr << "negative value times a wide positive operand clamps to min" << std::endl;
        return false;
    }
    if (FixedI32::from_integer(-1).saturating_mul_int(-beyond_inner) != max64) {
        std::cerr << "negative value times a wide negative operand clamps to max" << std::endl;
        return false;
    }
    if (FixedI32::one().saturating_mul_int(-beyond_inner) != min64 ||
        FixedI32::one().saturating_mul_int(beyond_inner) != max64) {
        std::cerr << "positive value times a wide operand clamps by the operand sign" << std::endl;
        return false;
    }
    std::cerr << "test_saturating_mul_int end" << std::endl;
    return true;
}

bool test_checked_div_int() {
    std::cerr << "test_checked_div_int start" << std::endl;
    if (FixedI64::from_integer(10).checked_div_int(4) != 2) {
        std::cerr << "10 / 4 keeps the integer part" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(-10).checked_div_int(4) != -2) {
        std::cerr << "-10 / 4 truncates toward zero" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(10).checked_div_int(0)) {
        std::cerr << "division by zero is empty" << std::endl;
        return false;
    }
    if (FixedI64::min_value().checked_div_int(-1)) {
        std::cerr << "min / -1 is empty" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(-10).checked_div_int(std::uint8_t{4})) {
        std::cerr << "negative quotient into unsigned is empty" << std::endl;
        return false;
    }
    if (FixedI128::from_integer(1'000'000).checked_div_int(std::int16_t{3})) {
        std::cerr << "333333 does not fit int16" << std::endl;
        return false;
    }
    if (FixedI128::from_integer(1'000'000).checked_div_int(std::int64_t{3}) != std::int64_t{333'333}) {
        std::cerr << "1e6 / 3 in FixedI128" << std::endl;
        return false;
    }
    std::cerr << "test_checked_div_int end" << std::endl;
    return true;
}

bool test_multiply_accumulate() {
    std::cerr << "test_multiply_accumulate start" << std::endl;
    const auto one_and_half = FixedI64::from_rational(3, 2);
    if (one_and_half.saturated_multiply_accumulate(std::int64_t{10}) != 25) {
        std::cerr << "10 + 1.5 * 10" << std::endl;
        return false;
    }
    if ((-one_and_half).saturated_multiply_accumulate(std::int64_t{10}) != -5) {
        std::cerr << "10 - 1.5 * 10" << std::endl;
        return false;
    }
    if (FixedI64::zero().saturated_multiply_accumulate(std::int64_t{42}) != 42) {
        std::cerr << "zero leaves the value unchanged" << std::endl;
        return false;
    }
    if (FixedI64::one().saturated_multiply_accumulate(std::int64_t{-21}) != -42) {
        std::cerr << "one doubles the value" << std::endl;
        return false;
    }
    const uint128 big = uint128{1} << 100;
    if (one_and_half.saturated_multiply_accumulate(big) != (uint128{1} << 101) + (uint128{1} << 99)) {
        std::cerr << "value far wider than the inner type" << std::endl;
        return false;
    }
    if (FixedI32::from_rational(3, 2).saturated_multiply_accumulate(std::int64_t{1'000'000'000'000'000'000}) !=
        std::int64_t{2'500'000'000'000'000'000}) {
        std::cerr << "FixedI32 applied to 1e18" << std::endl;
        return false;
    }
    if (FixedI64::min_value().saturated_multiply_accumulate(std::int64_t{1}) != -9'223'372'036) {
        std::cerr << "min applied to one" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(2).saturated_multiply_accumulate(std::numeric_limits<std::int64_t>::max()) !=
        std::numeric_limits<std::int64_t>::max()) {
        std::cerr << "accumulation saturates at max" << std::endl;
        return false;
    }
    if (FixedI64::from_integer(-3).saturated_multiply_accumulate(std::uint32_t{7}) != 0u) {
        std::cerr << "unsigned accumulation saturates at zero" << std::endl;
        return false;
    }
    std::cerr << "test_multiply_accumulate end" << std::endl;
    return true;
}

} // namespace

int main() {
    if (!test_checked_mul_int()) return 1;
    if (!test_saturating_mul_int()) return 1;
    if (!test_checked_div_int()) return 1;
    if (!test_multiply_accumulate()) return 1;
    return 0;
}
