// examples/example_fee_scaling.cpp — Scaling balances by fixed-point rates and ratios.

#include <cstdint>
#include <iostream>

#include <decfix/decfix.hpp>

int main() {
    const auto rate = decfix::FixedI64::from_rational(3, 1000);
    const std::uint64_t balance = 1'234'567'890'123ULL;

    std::cout << "rate            = " << rate << '\n';
    std::cout << "fee             = " << rate.saturating_mul_int(balance) << '\n';
    std::cout << "balance + fee   = " << rate.saturated_multiply_accumulate(balance) << '\n';

    const auto daily = decfix::FixedI64::from_rational(1'000'137, 1'000'000);
    const auto yearly = daily.saturating_pow(365);
    std::cout << "daily growth    = " << daily << '\n';
    std::cout << "compounded year = " << yearly << '\n';

    const auto share = decfix::Perbill::from_parts(250'000'000);
    std::cout << "quarter share   = " << share * balance << '\n';
    std::cout << "as fixed        = " << decfix::FixedI64(share) << '\n';

    const auto huge = decfix::FixedI32::max_value().checked_mul(decfix::FixedI32::from_integer(2));
    std::cout << "FixedI32 max * 2 " << (huge ? "fits" : "overflows") << '\n';
    return 0;
}
