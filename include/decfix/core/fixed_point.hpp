// include/decfix/core/fixed_point.hpp — Decimal fixed-point kernel parameterized by inner width and scale.

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <type_traits>

#include <decfix/core/detail/int_ops.hpp>
#include <decfix/core/per_thing.hpp>
#include <decfix/core/wide.hpp>

namespace decfix::core {

/// A rational value stored as `inner / DIV` in a signed integer of fixed width.
///
/// Three operation sets share the representation:
///  - checked_* return an empty optional on overflow or division by zero;
///  - saturating_* clamp to min_value()/max_value() by the sign of the true result;
///  - the raw operators (+ - * /) and from_rational() use plain integer
///    arithmetic on the inner value. They are unchecked: the caller asserts
///    the operands are in range and divisors are non-zero, and a violation
///    behaves exactly like the same violation on the backing integer.
///
/// `PrevUnsigned` only needs to hold `inner % DIV`; `PerThing` must have an
/// accuracy equal to DIV and is used to scale the fractional part during
/// saturated_multiply_accumulate().
template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
          std::size_t Precision>
class fixed_point {
public:
    using inner_type = Inner;
    using unsigned_type = Unsigned;
    using prev_unsigned_type = PrevUnsigned;
    using per_thing_type = PerThing;

    static constexpr Inner DIV = Div;
    static constexpr std::size_t PRECISION = Precision;
    static constexpr int BITS = detail::integer_limits<Inner>::bits;

    static_assert(detail::integer_limits<Inner>::is_signed, "fixed_point inner type must be signed");
    static_assert(!detail::integer_limits<Unsigned>::is_signed && sizeof(Unsigned) == sizeof(Inner),
                  "fixed_point unsigned type must be the unsigned counterpart of the inner type");
    static_assert(!detail::integer_limits<PrevUnsigned>::is_signed &&
                      sizeof(PrevUnsigned) * 2 == sizeof(Inner),
                  "fixed_point previous unsigned type must be half the inner width");
    static_assert(Div > 0, "fixed_point divisor must be positive");
    static_assert(detail::pow10(Precision) == static_cast<detail::uint128>(Div),
                  "fixed_point divisor must equal 10^PRECISION");
    static_assert(static_cast<detail::uint128>(Div - 1) <=
                      static_cast<detail::uint128>(detail::integer_limits<PrevUnsigned>::max()),
                  "fixed_point fractional parts must fit the previous unsigned type");
    static_assert(is_per_thing_v<PerThing> &&
                      static_cast<detail::uint128>(PerThing::ACCURACY) ==
                          static_cast<detail::uint128>(Div),
                  "fixed_point per-thing accuracy must equal the divisor");

    constexpr fixed_point() noexcept = default;

    // Whole units, saturating: fixed_point(3) represents 3.0.
    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr explicit fixed_point(Int value) noexcept
        : inner_(detail::saturating_mul(detail::saturating_cast<Inner>(value), DIV)) {}

    template <typename Ratio, std::enable_if_t<is_per_thing_v<Ratio>, int> = 0>
    constexpr explicit fixed_point(Ratio ratio) noexcept : inner_(from_per_thing(ratio).inner_) {}

    static constexpr fixed_point from_inner(Inner inner) noexcept {
        fixed_point result;
        result.inner_ = inner;
        return result;
    }

    constexpr Inner into_inner() const noexcept { return inner_; }

    static constexpr Inner accuracy() noexcept { return DIV; }

    static constexpr fixed_point from_integer(Inner value) noexcept {
        return from_inner(detail::saturating_mul(value, DIV));
    }

    static constexpr std::optional<fixed_point> checked_from_integer(Inner value) noexcept {
        if (const auto inner = detail::checked_mul(value, DIV)) {
            return from_inner(*inner);
        }
        return std::nullopt;
    }

    /// `n / d` with plain arithmetic after narrowing `n` (saturating) into Inner.
    ///
    /// Unchecked: requires `d != 0` and `n * DIV` representable. Use
    /// checked_from_rational() where either can fail.
    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    static constexpr fixed_point from_rational(Int numerator, Inner denominator) noexcept {
        return from_inner(
            static_cast<Inner>((detail::saturating_cast<Inner>(numerator) * DIV) / denominator));
    }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    static constexpr std::optional<fixed_point> checked_from_rational(Int numerator,
                                                                      Inner denominator) noexcept {
        if (denominator == 0) {
            return std::nullopt;
        }
        const auto narrowed = detail::checked_cast<Inner>(numerator);
        if (!narrowed) {
            return std::nullopt;
        }
        const auto scaled = detail::checked_mul(*narrowed, DIV);
        if (!scaled) {
            return std::nullopt;
        }
        if (const auto inner = detail::checked_div(*scaled, denominator)) {
            return from_inner(*inner);
        }
        return std::nullopt;
    }

    // Falls back to max_value() when the ratio does not fit this family.
    template <typename Ratio, std::enable_if_t<is_per_thing_v<Ratio>, int> = 0>
    static constexpr fixed_point from_per_thing(Ratio ratio) noexcept {
        return checked_from_rational(ratio.deconstruct(),
                                     detail::saturating_cast<Inner>(Ratio::ACCURACY))
            .value_or(max_value());
    }

    static constexpr fixed_point zero() noexcept { return fixed_point(); }
    static constexpr fixed_point one() noexcept { return from_inner(DIV); }
    static constexpr fixed_point min_value() noexcept {
        return from_inner(detail::integer_limits<Inner>::min());
    }
    static constexpr fixed_point max_value() noexcept {
        return from_inner(detail::integer_limits<Inner>::max());
    }

    constexpr bool is_zero() const noexcept { return inner_ == 0; }
    constexpr bool is_positive() const noexcept { return inner_ > 0; }
    constexpr bool is_negative() const noexcept { return inner_ < 0; }
    constexpr int signum() const noexcept { return (inner_ > 0) - (inner_ < 0); }

    constexpr std::optional<fixed_point> checked_add(const fixed_point &rhs) const noexcept {
        if (const auto sum = detail::checked_add(inner_, rhs.inner_)) {
            return from_inner(*sum);
        }
        return std::nullopt;
    }

    constexpr std::optional<fixed_point> checked_sub(const fixed_point &rhs) const noexcept {
        if (const auto difference = detail::checked_sub(inner_, rhs.inner_)) {
            return from_inner(*difference);
        }
        return std::nullopt;
    }

    constexpr std::optional<fixed_point> checked_mul(const fixed_point &rhs) const noexcept {
        const auto lhs_parts = detail::split(inner_);
        const auto rhs_parts = detail::split(rhs.inner_);
        return rescale(lhs_parts.negative != rhs_parts.negative, lhs_parts.magnitude,
                       rhs_parts.magnitude, DIV_MAGNITUDE);
    }

    constexpr std::optional<fixed_point> checked_div(const fixed_point &rhs) const noexcept {
        if (rhs.inner_ == 0) {
            return std::nullopt;
        }
        if (inner_ == 0) {
            return *this;
        }
        if (*this == min_value() && rhs == from_integer(-1)) {
            return std::nullopt;
        }
        const auto lhs_parts = detail::split(inner_);
        const auto rhs_parts = detail::split(rhs.inner_);
        return rescale(lhs_parts.negative != rhs_parts.negative, lhs_parts.magnitude,
                       DIV_MAGNITUDE, rhs_parts.magnitude);
    }

    constexpr fixed_point saturating_add(const fixed_point &rhs) const noexcept {
        return from_inner(detail::saturating_add(inner_, rhs.inner_));
    }

    constexpr fixed_point saturating_sub(const fixed_point &rhs) const noexcept {
        return from_inner(detail::saturating_sub(inner_, rhs.inner_));
    }

    constexpr fixed_point saturating_mul(const fixed_point &rhs) const noexcept {
        if (const auto product = checked_mul(rhs)) {
            return *product;
        }
        return signum() * rhs.signum() < 0 ? min_value() : max_value();
    }

    // -MIN is not representable; it clamps to max_value().
    constexpr fixed_point saturating_abs() const noexcept {
        if (*this == min_value()) {
            return max_value();
        }
        return is_negative() ? from_inner(-inner_) : *this;
    }

    constexpr fixed_point saturating_pow(std::size_t exponent) const noexcept {
        if (exponent == 0) {
            return one();
        }
        fixed_point result = one();
        fixed_point power = *this;
        while (exponent != 0) {
            if ((exponent & 1U) != 0) {
                result = result.saturating_mul(power);
            }
            exponent >>= 1;
            if (exponent != 0) {
                power = power.saturating_mul(power);
            }
        }
        return result;
    }

    /// `self * other` for an integer of any width, truncated toward zero.
    ///
    /// `other` must fit the inner type; the result must fit `Int`.
    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr std::optional<Int> checked_mul_int(Int other) const noexcept {
        const auto rhs = detail::checked_cast<Inner>(other);
        if (!rhs) {
            return std::nullopt;
        }
        const auto lhs_parts = detail::split(inner_);
        const auto rhs_parts = detail::split(*rhs);
        const auto product =
            scaled_multiply_divide(lhs_parts.magnitude, rhs_parts.magnitude, DIV_MAGNITUDE);
        if (!product) {
            return std::nullopt;
        }
        return detail::join<Int>(lhs_parts.negative != rhs_parts.negative, *product);
    }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr std::optional<Int> checked_div_int(Int other) const noexcept {
        const auto rhs = detail::checked_cast<Inner>(other);
        if (!rhs) {
            return std::nullopt;
        }
        const auto quotient = detail::checked_div(inner_, *rhs);
        if (!quotient) {
            return std::nullopt;
        }
        return detail::checked_cast<Int>(static_cast<Inner>(*quotient / DIV));
    }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr Int saturating_mul_int(Int other) const noexcept {
        if (const auto product = checked_mul_int(other)) {
            return *product;
        }
        // Clamp by signum(other) * signum(self); a zero sign clamps to max.
        const int other_sign = detail::is_negative(other) ? -1 : (other != 0 ? 1 : 0);
        return other_sign * signum() < 0 ? detail::integer_limits<Int>::min()
                                         : detail::integer_limits<Int>::max();
    }

    /// `value + self * value`, or `value - |self| * value` when self is negative.
    ///
    /// `value` may be far wider than the inner type. The whole part of
    /// |self| multiplies `value` directly and the fractional part goes
    /// through PerThing, so the full product `inner * value` is never formed.
    /// Every step saturates.
    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr Int saturated_multiply_accumulate(Int value) const noexcept {
        const bool positive = inner_ > 0;
        const detail::uint128 parts = detail::magnitude(inner_);

        const Int natural_parts = detail::saturating_cast<Int>(parts / DIV_MAGNITUDE);
        const PrevUnsigned fractional_parts = static_cast<PrevUnsigned>(parts % DIV_MAGNITUDE);

        const Int whole = detail::saturating_mul(value, natural_parts);
        const Int fraction = PerThing::from_parts(fractional_parts) * value;
        const Int excess = detail::saturating_add(whole, fraction);

        return positive ? detail::saturating_add(value, excess)
                        : detail::saturating_sub(value, excess);
    }

    constexpr std::array<std::uint8_t, sizeof(Inner)> to_bytes() const noexcept {
        std::array<std::uint8_t, sizeof(Inner)> bytes{};
        const Unsigned bits = static_cast<Unsigned>(inner_);
        for (std::size_t index = 0; index < bytes.size(); ++index) {
            bytes[index] = static_cast<std::uint8_t>(bits >> (8 * index));
        }
        return bytes;
    }

    static constexpr fixed_point from_bytes(const std::array<std::uint8_t, sizeof(Inner)> &bytes) noexcept {
        Unsigned bits = 0;
        for (std::size_t index = 0; index < bytes.size(); ++index) {
            bits |= static_cast<Unsigned>(bytes[index]) << (8 * index);
        }
        return from_inner(static_cast<Inner>(bits));
    }

    // Raw operators: see the class comment, none of these are checked.
    constexpr fixed_point operator-() const noexcept { return from_inner(-inner_); }

    constexpr fixed_point &operator+=(const fixed_point &other) noexcept {
        inner_ = static_cast<Inner>(inner_ + other.inner_);
        return *this;
    }

    constexpr fixed_point &operator-=(const fixed_point &other) noexcept {
        inner_ = static_cast<Inner>(inner_ - other.inner_);
        return *this;
    }

    constexpr fixed_point &operator*=(const fixed_point &other) noexcept {
        inner_ = static_cast<Inner>((inner_ * other.inner_) / DIV);
        return *this;
    }

    constexpr fixed_point &operator/=(const fixed_point &other) noexcept {
        inner_ = static_cast<Inner>((inner_ * DIV) / other.inner_);
        return *this;
    }

    friend constexpr fixed_point operator+(fixed_point lhs, const fixed_point &rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr fixed_point operator-(fixed_point lhs, const fixed_point &rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr fixed_point operator*(fixed_point lhs, const fixed_point &rhs) noexcept {
        lhs *= rhs;
        return lhs;
    }

    friend constexpr fixed_point operator/(fixed_point lhs, const fixed_point &rhs) noexcept {
        lhs /= rhs;
        return lhs;
    }

    friend constexpr bool operator==(const fixed_point &lhs, const fixed_point &rhs) noexcept {
        return lhs.inner_ == rhs.inner_;
    }

    friend constexpr std::strong_ordering operator<=>(const fixed_point &lhs,
                                                      const fixed_point &rhs) noexcept {
        if (lhs.inner_ < rhs.inner_) {
            return std::strong_ordering::less;
        }
        if (lhs.inner_ > rhs.inner_) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

private:
    static constexpr detail::uint128 DIV_MAGNITUDE = static_cast<detail::uint128>(Div);

    // Shared tail of every signed multiply/divide: widened magnitude
    // computation, then the sign put back.
    static constexpr std::optional<fixed_point> rescale(bool negative, detail::uint128 a,
                                                        detail::uint128 b,
                                                        detail::uint128 c) noexcept {
        const auto magnitude = scaled_multiply_divide(a, b, c);
        if (!magnitude) {
            return std::nullopt;
        }
        if (const auto inner = detail::join<Inner>(negative, *magnitude)) {
            return from_inner(*inner);
        }
        return std::nullopt;
    }

    Inner inner_{};
};

template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
          std::size_t Precision>
inline std::size_t
canonical_hash(const fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision> &value) noexcept {
    constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ULL;
    constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;
    std::uint64_t hash = FNV_OFFSET;
    for (auto byte : value.to_bytes()) {
        hash ^= byte;
        hash *= FNV_PRIME;
    }
    if constexpr (sizeof(std::size_t) >= 8) {
        return static_cast<std::size_t>(hash);
    }
    return static_cast<std::size_t>((hash >> 32) ^ (hash & 0xFFFFFFFFULL));
}

using fixed_i32 = fixed_point<std::int32_t, std::uint32_t, std::uint16_t, permyriad, 10'000, 4>;
using fixed_i64 =
    fixed_point<std::int64_t, std::uint64_t, std::uint32_t, perbill, 1'000'000'000, 9>;
using fixed_i128 = fixed_point<detail::int128, detail::uint128, std::uint64_t, perquintill,
                               1'000'000'000'000'000'000LL, 18>;

} // namespace decfix::core

namespace std {

template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
          std::size_t Precision>
class numeric_limits<decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>> {
public:
    using value_type = decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>;

    static constexpr bool is_specialized = true;

    static constexpr value_type min() noexcept { return value_type::min_value(); }
    static constexpr value_type max() noexcept { return value_type::max_value(); }
    static constexpr value_type lowest() noexcept { return value_type::min_value(); }
    static constexpr value_type epsilon() noexcept { return value_type::from_inner(1); }
    static constexpr value_type round_error() noexcept { return value_type::from_inner(1); }
    static constexpr value_type denorm_min() noexcept { return value_type::zero(); }
    static constexpr value_type infinity() noexcept { return value_type::zero(); }
    static constexpr value_type quiet_NaN() noexcept { return value_type::zero(); }
    static constexpr value_type signaling_NaN() noexcept { return value_type::zero(); }

    static constexpr int digits = value_type::BITS - 1;
    static constexpr int digits10 = decfix::core::detail::decimal_digit_count(
                                        static_cast<decfix::core::detail::uint128>(
                                            decfix::core::detail::integer_limits<Inner>::max())) -
                                    1;
    static constexpr int max_digits10 = digits10 + 1;
    static constexpr int radix = 10;
    static constexpr int min_exponent = 0;
    static constexpr int max_exponent = 0;
    static constexpr int min_exponent10 = -static_cast<int>(Precision);
    static constexpr int max_exponent10 = 0;

    static constexpr bool is_signed = true;
    static constexpr bool is_integer = false;
    static constexpr bool is_exact = true;
    static constexpr bool has_infinity = false;
    static constexpr bool has_quiet_NaN = false;
    static constexpr bool has_signaling_NaN = false;
    static constexpr bool has_denorm = false;
    static constexpr bool has_denorm_loss = false;
    static constexpr bool is_bounded = true;
    static constexpr bool is_modulo = false;
    static constexpr bool traps = false;
    static constexpr bool tinyness_before = false;
    static constexpr float_round_style round_style = round_toward_zero;
    static constexpr bool is_iec559 = false;
};

template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
          std::size_t Precision>
struct hash<decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>> {
    std::size_t operator()(
        const decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>
            &value) const noexcept {
        return decfix::core::canonical_hash(value);
    }
};

} // namespace std
