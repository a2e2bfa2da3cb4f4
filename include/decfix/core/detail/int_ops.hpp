// include/decfix/core/detail/int_ops.hpp — Checked, saturating and narrowing helpers over every integer width.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>

namespace decfix::core::detail {

#if !defined(__SIZEOF_INT128__)
#error "decfix requires __int128 support"
#endif

using int128 = __int128_t;
using uint128 = unsigned __int128;

template <typename T>
inline constexpr bool is_integer_v =
    (std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>) ||
    std::is_same_v<std::remove_cv_t<T>, int128> || std::is_same_v<std::remove_cv_t<T>, uint128>;

// std::numeric_limits is not specialized for the 128-bit types in strict modes.
template <typename T> struct integer_limits {
    static_assert(is_integer_v<T>, "integer_limits requires an integer type");

    static constexpr bool is_signed = static_cast<T>(-1) < static_cast<T>(0);
    static constexpr int bits = static_cast<int>(sizeof(T) * 8);

    static constexpr T max() noexcept {
        if constexpr (is_signed) {
            return static_cast<T>((uint128{1} << (bits - 1)) - 1);
        } else {
            return static_cast<T>(~uint128{0});
        }
    }

    static constexpr T min() noexcept {
        if constexpr (is_signed) {
            return static_cast<T>(-max() - 1);
        } else {
            return static_cast<T>(0);
        }
    }
};

inline constexpr uint128 pow10(std::size_t exponent) noexcept {
    uint128 value = 1;
    for (std::size_t index = 0; index < exponent; ++index) {
        value *= 10;
    }
    return value;
}

inline constexpr int decimal_digit_count(uint128 value) noexcept {
    if (value == 0) {
        return 1;
    }
    int digits = 0;
    while (value != 0) {
        value /= 10;
        ++digits;
    }
    return digits;
}

template <typename T> constexpr bool is_negative(T value) noexcept {
    if constexpr (integer_limits<T>::is_signed) {
        return value < 0;
    } else {
        (void)value;
        return false;
    }
}

template <typename T> constexpr T signum(T value) noexcept {
    if constexpr (integer_limits<T>::is_signed) {
        return static_cast<T>((value > 0) - (value < 0));
    } else {
        return static_cast<T>(value != 0);
    }
}

// |value| as an unsigned 128-bit magnitude; exact for the minimum of every signed width.
template <typename T> constexpr uint128 magnitude(T value) noexcept {
    if (is_negative(value)) {
        return uint128{0} - static_cast<uint128>(value);
    }
    return static_cast<uint128>(value);
}

struct signed_magnitude {
    bool negative;
    uint128 magnitude;
};

template <typename T> constexpr signed_magnitude split(T value) noexcept {
    return {is_negative(value), magnitude(value)};
}

// Inverse of split: empty when the signed result does not fit T.
template <typename T> constexpr std::optional<T> join(bool negative, uint128 value) noexcept {
    using limits = integer_limits<T>;
    if (!negative || value == 0) {
        if (value > static_cast<uint128>(limits::max())) {
            return std::nullopt;
        }
        return static_cast<T>(value);
    }
    if constexpr (!limits::is_signed) {
        return std::nullopt;
    } else {
        if (value > static_cast<uint128>(limits::max()) + 1) {
            return std::nullopt;
        }
        return static_cast<T>(uint128{0} - value);
    }
}

template <typename To, typename From> constexpr std::optional<To> checked_cast(From value) noexcept {
    const auto parts = split(value);
    return join<To>(parts.negative, parts.magnitude);
}

template <typename To, typename From> constexpr To saturating_cast(From value) noexcept {
    if (const auto narrowed = checked_cast<To>(value)) {
        return *narrowed;
    }
    return is_negative(value) ? integer_limits<To>::min() : integer_limits<To>::max();
}

template <typename T> constexpr std::optional<T> checked_add(T lhs, T rhs) noexcept {
    T result{};
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        return std::nullopt;
    }
    return result;
}

template <typename T> constexpr std::optional<T> checked_sub(T lhs, T rhs) noexcept {
    T result{};
    if (__builtin_sub_overflow(lhs, rhs, &result)) {
        return std::nullopt;
    }
    return result;
}

template <typename T> constexpr std::optional<T> checked_mul(T lhs, T rhs) noexcept {
    T result{};
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
        return std::nullopt;
    }
    return result;
}

template <typename T> constexpr std::optional<T> checked_div(T lhs, T rhs) noexcept {
    if (rhs == 0) {
        return std::nullopt;
    }
    if constexpr (integer_limits<T>::is_signed) {
        if (lhs == integer_limits<T>::min() && rhs == static_cast<T>(-1)) {
            return std::nullopt;
        }
    }
    return static_cast<T>(lhs / rhs);
}

template <typename T> constexpr T saturating_add(T lhs, T rhs) noexcept {
    if (const auto sum = checked_add(lhs, rhs)) {
        return *sum;
    }
    return is_negative(rhs) ? integer_limits<T>::min() : integer_limits<T>::max();
}

template <typename T> constexpr T saturating_sub(T lhs, T rhs) noexcept {
    if (const auto difference = checked_sub(lhs, rhs)) {
        return *difference;
    }
    if constexpr (integer_limits<T>::is_signed) {
        return rhs < 0 ? integer_limits<T>::max() : integer_limits<T>::min();
    } else {
        return integer_limits<T>::min();
    }
}

template <typename T> constexpr T saturating_mul(T lhs, T rhs) noexcept {
    if (const auto product = checked_mul(lhs, rhs)) {
        return *product;
    }
    return is_negative(lhs) != is_negative(rhs) ? integer_limits<T>::min()
                                                : integer_limits<T>::max();
}

} // namespace decfix::core::detail
