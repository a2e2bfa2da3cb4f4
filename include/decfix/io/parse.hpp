// include/decfix/io/parse.hpp — Reading fixed-point values back from their inner-value text.

#pragma once

#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <decfix/core/detail/int_ops.hpp>
#include <decfix/core/traits.hpp>

namespace decfix::io {

namespace detail {

enum class parse_status { ok, invalid, out_of_range };

// Parses `[+-]digits` into Int; no whitespace, no separators.
template <typename Int>
constexpr parse_status parse_decimal_integer(std::string_view text, Int &out) noexcept {
    using core::detail::uint128;
    if (text.empty()) {
        return parse_status::invalid;
    }
    bool negative = false;
    std::size_t index = 0;
    if (text[0] == '+' || text[0] == '-') {
        negative = (text[0] == '-');
        ++index;
        if (index == text.size()) {
            return parse_status::invalid;
        }
    }
    constexpr uint128 LIMIT = ~uint128{0};
    uint128 accumulator = 0;
    bool overflow = false;
    for (; index < text.size(); ++index) {
        const char ch = text[index];
        if (ch < '0' || ch > '9') {
            return parse_status::invalid;
        }
        const auto digit = static_cast<uint128>(ch - '0');
        if (accumulator > (LIMIT - digit) / 10) {
            overflow = true;
            continue;
        }
        accumulator = accumulator * 10 + digit;
    }
    if (overflow) {
        return parse_status::out_of_range;
    }
    const auto value = core::detail::join<Int>(negative, accumulator);
    if (!value) {
        return parse_status::out_of_range;
    }
    out = *value;
    return parse_status::ok;
}

} // namespace detail

template <typename Fixed, typename = std::enable_if_t<core::is_fixed_point_v<Fixed>>>
constexpr std::optional<Fixed> try_from_inner_string(std::string_view text) noexcept {
    typename Fixed::inner_type inner{};
    if (detail::parse_decimal_integer(text, inner) != detail::parse_status::ok) {
        return std::nullopt;
    }
    return Fixed::from_inner(inner);
}

template <typename Fixed, typename = std::enable_if_t<core::is_fixed_point_v<Fixed>>>
inline Fixed from_inner_string(std::string_view text) {
    typename Fixed::inner_type inner{};
    switch (detail::parse_decimal_integer(text, inner)) {
    case detail::parse_status::ok:
        return Fixed::from_inner(inner);
    case detail::parse_status::out_of_range:
        throw std::out_of_range("fixed-point inner value out of range");
    case detail::parse_status::invalid:
        break;
    }
    throw std::invalid_argument("invalid fixed-point string input");
}

} // namespace decfix::io
