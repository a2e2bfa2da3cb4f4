// bench/bench_fixed_scaling.cpp — Benchmarks for integer scaling, ratios and the wide primitive.

#include <cstdint>

#include <benchmark/benchmark.h>

#include <decfix/decfix.hpp>

namespace {

using decfix::core::detail::uint128;

static void BM_ScaledMultiplyDivideNarrow(benchmark::State& state) {
    const uint128 a = 123'456'789'012ULL;
    const uint128 b = 987'654'321ULL;
    const uint128 c = 1'000'000'000ULL;
    for (auto _ : state) {
        benchmark::DoNotOptimize(decfix::core::scaled_multiply_divide(a, b, c));
    }
}
BENCHMARK(BM_ScaledMultiplyDivideNarrow);

static void BM_ScaledMultiplyDivideWide(benchmark::State& state) {
    const uint128 a = (uint128{1} << 120) + 12345;
    const uint128 b = 1'000'000'000'000'000'000ULL;
    const uint128 c = (uint128{1} << 70) + 3;
    for (auto _ : state) {
        benchmark::DoNotOptimize(decfix::core::scaled_multiply_divide(a, b, c));
    }
}
BENCHMARK(BM_ScaledMultiplyDivideWide);

static void BM_SaturatingMulInt(benchmark::State& state) {
    const auto fee = decfix::FixedI64::from_rational(3, 1000);
    std::int64_t amount = 1'000'000'007;
    for (auto _ : state) {
        benchmark::DoNotOptimize(fee.saturating_mul_int(amount));
        ++amount;
    }
}
BENCHMARK(BM_SaturatingMulInt);

static void BM_MultiplyAccumulateWide(benchmark::State& state) {
    const auto factor = decfix::FixedI128::from_rational(1'000'001, 1'000'000);
    const uint128 balance = (uint128{1} << 110) + 17;
    for (auto _ : state) {
        benchmark::DoNotOptimize(factor.saturated_multiply_accumulate(balance));
    }
}
BENCHMARK(BM_MultiplyAccumulateWide);

static void BM_PerbillProduct(benchmark::State& state) {
    const auto ratio = decfix::Perbill::from_parts(123'456'789);
    std::uint64_t value = 0xfeedfacecafebeefULL;
    for (auto _ : state) {
        benchmark::DoNotOptimize(ratio * value);
        value ^= value << 7;
    }
}
BENCHMARK(BM_PerbillProduct);

static void BM_SaturatingPow(benchmark::State& state) {
    const auto base = decfix::FixedI64::from_rational(1'000'001, 1'000'000);
    for (auto _ : state) {
        benchmark::DoNotOptimize(base.saturating_pow(static_cast<std::size_t>(state.range(0))));
    }
}
BENCHMARK(BM_SaturatingPow)->Arg(8)->Arg(64)->Arg(365);

} // namespace

BENCHMARK_MAIN();
