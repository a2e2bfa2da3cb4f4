// bench/bench_fixed_ops.cpp — Benchmark for checked and saturating fixed-point arithmetic.

#include <cstdint>
#include <random>

#include <benchmark/benchmark.h>

#include <decfix/decfix.hpp>

namespace {

    enum class Operation : std::uint64_t {
        CheckedMul,
        CheckedDiv,
        SaturatingMul,
        RawMul,
    };

    constexpr std::uint64_t seed_offset(Operation op, int bits) noexcept {
        return 0x5a5a5a5a5a5a5a5aull + (static_cast<std::uint64_t>(op) << 8) +
               static_cast<std::uint64_t>(bits);
    }

    template <typename Fixed>
    void bench_fixed_operation(benchmark::State &state, Operation op, std::uint64_t seed) {
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        // Raw products must stay inside the inner type.
        const std::int64_t limit = op == Operation::RawMul ? 2 : (Fixed::BITS == 32 ? 100 : 1'000'000);
        while (state.KeepRunning()) {
            const auto lhs = decfix::util::random_fixed_bounded<Fixed>(rng, limit);
            auto rhs = decfix::util::random_fixed_bounded<Fixed>(rng, limit);
            if (rhs.is_zero()) {
                rhs = Fixed::one();
            }
            switch (op) {
            case Operation::CheckedMul:
                benchmark::DoNotOptimize(lhs.checked_mul(rhs));
                break;
            case Operation::CheckedDiv:
                benchmark::DoNotOptimize(lhs.checked_div(rhs));
                break;
            case Operation::SaturatingMul:
                benchmark::DoNotOptimize(lhs.saturating_mul(rhs));
                break;
            case Operation::RawMul:
                benchmark::DoNotOptimize(lhs * rhs);
                break;
            }
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI32>,
                  checked_mul_i32,
                  Operation::CheckedMul,
                  seed_offset(Operation::CheckedMul, 32));
BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI64>,
                  checked_mul_i64,
                  Operation::CheckedMul,
                  seed_offset(Operation::CheckedMul, 64));
BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI128>,
                  checked_mul_i128,
                  Operation::CheckedMul,
                  seed_offset(Operation::CheckedMul, 128));

BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI64>,
                  checked_div_i64,
                  Operation::CheckedDiv,
                  seed_offset(Operation::CheckedDiv, 64));
BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI128>,
                  checked_div_i128,
                  Operation::CheckedDiv,
                  seed_offset(Operation::CheckedDiv, 128));

BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI64>,
                  saturating_mul_i64,
                  Operation::SaturatingMul,
                  seed_offset(Operation::SaturatingMul, 64));
BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI128>,
                  saturating_mul_i128,
                  Operation::SaturatingMul,
                  seed_offset(Operation::SaturatingMul, 128));

BENCHMARK_CAPTURE(bench_fixed_operation<decfix::FixedI64>,
                  raw_mul_i64,
                  Operation::RawMul,
                  seed_offset(Operation::RawMul, 64));

BENCHMARK_MAIN();
