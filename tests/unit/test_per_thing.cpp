// tests/unit/test_per_thing.cpp — Unit tests for bounded ratio types and their integer products.

#include <cstdint>
#include <iostream>
#include <limits>

#include <decfix/decfix.hpp>

namespace {

using decfix::Perbill;
using decfix::Percent;
using decfix::Perquintill;
using decfix::core::detail::int128;
using decfix::core::detail::uint128;

static_assert(Percent::ACCURACY == 100);
static_assert(Perbill::from_parts(2'000'000'000u).deconstruct() == 1'000'000'000u);
static_assert(Percent::from_parts(50) * 10 == 5);

bool test_construction() {
    std::cerr << "test_construction start" << std::endl;
    if (!Percent::zero().is_zero() || !Percent::one().is_one()) {
        std::cerr << "Percent zero/one" << std::endl;
        return false;
    }
    if (Percent::from_parts(250).deconstruct() != 100) {
        std::cerr << "from_parts clamps to accuracy" << std::endl;
        return false;
    }
    if (!(Percent::from_parts(10) < Percent::from_parts(20)) ||
        Percent::from_parts(30) != Percent::from_parts(30)) {
        std::cerr << "Percent ordering" << std::endl;
        return false;
    }
    std::cerr << "test_construction end" << std::endl;
    return true;
}

bool test_integer_product() {
    std::cerr << "test_integer_product start" << std::endl;
    if (Percent::from_parts(50) * -10 != -5 || -10 * Percent::from_parts(50) != -5) {
        std::cerr << "signed product" << std::endl;
        return false;
    }
    if (Percent::from_parts(33) * 10 != 3) {
        std::cerr << "3.3 rounds down" << std::endl;
        return false;
    }
    if (Percent::from_parts(35) * 10 != 4 || Percent::from_parts(35) * -10 != -4) {
        std::cerr << "3.5 rounds away from zero" << std::endl;
        return false;
    }
    if (Percent::zero() * std::numeric_limits<std::int64_t>::max() != 0) {
        std::cerr << "zero ratio" << std::endl;
        return false;
    }
    const auto u64_max = std::numeric_limits<std::uint64_t>::max();
    if (Perbill::one() * u64_max != u64_max) {
        std::cerr << "full ratio of u64 max" << std::endl;
        return false;
    }
    const int128 min128 = decfix::core::detail::integer_limits<int128>::min();
    if (Perquintill::one() * min128 != min128) {
        std::cerr << "full ratio of int128 min" << std::endl;
        return false;
    }
    const uint128 u128_max = ~uint128{0};
    if (Perquintill::from_parts(500'000'000'000'000'000ULL) * u128_max != (uint128{1} << 127)) {
        std::cerr << "half of u128 max rounds up" << std::endl;
        return false;
    }
    if (Perbill::from_parts(1) * std::uint64_t{1'000'000'000'000} != 1'000u) {
        std::cerr << "one part per billion" << std::endl;
        return false;
    }
    std::cerr << "test_integer_product end" << std::endl;
    return true;
}

} // namespace

int main() {
    if (!test_construction()) return 1;
    if (!test_integer_product()) return 1;
    return 0;
}
