// include/decfix/core/per_thing.hpp — Bounded ratio types (parts of a fixed accuracy).

#pragma once

#include <compare>
#include <cstdint>
#include <type_traits>

#include <decfix/core/detail/int_ops.hpp>

namespace decfix::core {

/// A value in [0, ACCURACY] stored as its number of parts.
///
/// Multiplying an integer by a ratio never overflows: the product is
/// computed as whole multiples of ACCURACY plus a remainder term, and its
/// magnitude never exceeds that of the integer operand. The remainder term
/// is rounded to the nearest part, halves away from zero.
template <typename Parts, Parts Accuracy> class per_thing {
public:
    static_assert(detail::is_integer_v<Parts> && !detail::integer_limits<Parts>::is_signed,
                  "per_thing parts must be an unsigned integer");
    static_assert(sizeof(Parts) <= 8, "per_thing accuracy must square into 128 bits");
    static_assert(Accuracy > 0, "per_thing accuracy must be positive");

    using parts_type = Parts;
    static constexpr Parts ACCURACY = Accuracy;

    constexpr per_thing() noexcept = default;

    static constexpr per_thing zero() noexcept { return per_thing(); }
    static constexpr per_thing one() noexcept { return from_parts(ACCURACY); }

    // Clamps to ACCURACY.
    static constexpr per_thing from_parts(Parts parts) noexcept {
        per_thing result;
        result.parts_ = parts < ACCURACY ? parts : ACCURACY;
        return result;
    }

    constexpr Parts deconstruct() const noexcept { return parts_; }
    constexpr bool is_zero() const noexcept { return parts_ == 0; }
    constexpr bool is_one() const noexcept { return parts_ == ACCURACY; }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    constexpr Int mul_int(Int value) const noexcept {
        constexpr detail::uint128 accuracy = ACCURACY;
        const auto [negative, abs] = detail::split(value);
        const detail::uint128 parts = parts_;
        const detail::uint128 whole = (abs / accuracy) * parts;
        const detail::uint128 rem_product = (abs % accuracy) * parts;
        detail::uint128 fraction = rem_product / accuracy;
        if ((rem_product % accuracy) * 2 >= accuracy) {
            ++fraction;
        }
        const detail::uint128 total = whole + fraction;
        // total <= abs, so the signed result is always representable in Int.
        return static_cast<Int>(negative ? detail::uint128{0} - total : total);
    }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    friend constexpr Int operator*(const per_thing &ratio, Int value) noexcept {
        return ratio.mul_int(value);
    }

    template <typename Int, typename = std::enable_if_t<detail::is_integer_v<Int>>>
    friend constexpr Int operator*(Int value, const per_thing &ratio) noexcept {
        return ratio.mul_int(value);
    }

    friend constexpr bool operator==(const per_thing &lhs, const per_thing &rhs) noexcept {
        return lhs.parts_ == rhs.parts_;
    }

    friend constexpr std::strong_ordering operator<=>(const per_thing &lhs,
                                                      const per_thing &rhs) noexcept {
        return lhs.parts_ <=> rhs.parts_;
    }

private:
    Parts parts_{};
};

using percent = per_thing<std::uint8_t, 100>;
using permyriad = per_thing<std::uint16_t, 10'000>;
using permill = per_thing<std::uint32_t, 1'000'000>;
using perbill = per_thing<std::uint32_t, 1'000'000'000>;
using perquintill = per_thing<std::uint64_t, 1'000'000'000'000'000'000ULL>;

template <typename T> struct is_per_thing : std::false_type {};

template <typename Parts, Parts Accuracy>
struct is_per_thing<per_thing<Parts, Accuracy>> : std::true_type {};

template <typename T> inline constexpr bool is_per_thing_v = is_per_thing<T>::value;

} // namespace decfix::core
