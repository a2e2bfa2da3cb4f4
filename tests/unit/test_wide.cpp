// tests/unit/test_wide.cpp — Unit tests for the 256-bit product and scaled multiply-divide.

#include <iostream>
#include <random>

#include <decfix/decfix.hpp>

namespace {

using decfix::core::mul_wide;
using decfix::core::scaled_multiply_divide;
using decfix::core::detail::uint128;

constexpr uint128 U128_MAX = ~uint128{0};

uint128 random_u128(std::mt19937_64& rng) {
    return (static_cast<uint128>(rng()) << 64) | rng();
}

static_assert(scaled_multiply_divide(6, 7, 3).value() == 14);
static_assert(!scaled_multiply_divide(1, 1, 0).has_value());

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message) {
        if (!condition) {
            all_good = false;
            std::cerr << "wide arithmetic test failed: " << message << '\n';
        }
    };

    {
        const auto [high, low] = mul_wide(0, U128_MAX);
        expect(high == 0 && low == 0, "zero product");
    }
    {
        const auto [high, low] = mul_wide(uint128{1} << 64, uint128{1} << 64);
        expect(high == 1 && low == 0, "2^64 * 2^64 carries into the high half");
    }
    {
        const auto [high, low] = mul_wide(U128_MAX, U128_MAX);
        expect(high == U128_MAX - 1 && low == 1, "max * max");
    }
    {
        const auto [high, low] = mul_wide(U128_MAX, 2);
        expect(high == 1 && low == U128_MAX - 1, "max * 2");
    }

    expect(scaled_multiply_divide(10, 3, 4) == uint128{7}, "quotient floors");
    expect(!scaled_multiply_divide(5, 5, 0), "zero divisor is empty");
    expect(scaled_multiply_divide(0, U128_MAX, 1) == uint128{0}, "zero numerator");
    expect(scaled_multiply_divide(U128_MAX, U128_MAX, U128_MAX) == U128_MAX,
           "max * max / max uses the long division path");
    expect(scaled_multiply_divide(U128_MAX, 2, 2) == U128_MAX, "max * 2 / 2");
    expect(!scaled_multiply_divide(U128_MAX, 2, 1), "quotient above 128 bits is empty");
    expect(scaled_multiply_divide(uint128{1} << 100, uint128{1} << 100, uint128{1} << 90) ==
               (uint128{1} << 110),
           "2^100 * 2^100 / 2^90");
    expect(scaled_multiply_divide(uint128{1} << 127, 3, 4) == ((uint128{1} << 127) / 4) * 3,
           "three quarters of 2^127");

    std::mt19937_64 rng(0x5eedf12ed);
    for (int iteration = 0; iteration < 2000; ++iteration) {
        const std::uint64_t a = rng();
        const std::uint64_t b = rng();
        const std::uint64_t c = rng() | 1;
        const uint128 reference = static_cast<uint128>(a) * b / c;
        expect(scaled_multiply_divide(a, b, c) == reference, "64-bit operands match direct math");
    }

    for (int iteration = 0; iteration < 2000; ++iteration) {
        const uint128 a = random_u128(rng);
        const uint128 b = random_u128(rng) | 1;
        expect(scaled_multiply_divide(a, b, b) == a, "a * b / b == a");
        expect(scaled_multiply_divide(b, a, b) == a, "b * a / b == a");
        const uint128 half = (b >> 1) | 1;
        const auto quotient = scaled_multiply_divide(a, half, b);
        expect(quotient.has_value() && *quotient <= a, "scaling by a ratio below one shrinks");
    }

    if (!all_good) {
        std::cerr << "wide arithmetic regression failed\n";
        return 1;
    }
    std::cout << "wide arithmetic tests passed\n";
    return 0;
}
