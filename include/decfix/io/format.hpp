// include/decfix/io/format.hpp — Text rendering of fixed-point values.

#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include <decfix/core/detail/int_ops.hpp>
#include <decfix/core/traits.hpp>

namespace decfix::io {

    namespace detail {

        inline std::string magnitude_string(core::detail::uint128 value) {
            if (value == 0) {
                return "0";
            }
            std::string digits;
            while (value != 0) {
                digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
                value /= 10;
            }
            std::reverse(digits.begin(), digits.end());
            return digits;
        }

    } // namespace detail

    /// Decimal text of the raw inner integer; from_inner_string() reads it back exactly.
    template <typename Fixed, typename = std::enable_if_t<core::is_fixed_point_v<Fixed>>>
    inline std::string to_inner_string(const Fixed &value) {
        const auto parts = core::detail::split(value.into_inner());
        std::string text = detail::magnitude_string(parts.magnitude);
        if (parts.negative) {
            text.insert(text.begin(), '-');
        }
        return text;
    }

    /// `[-]integer.fraction`, the fraction zero-padded to PRECISION digits.
    template <typename Fixed, typename = std::enable_if_t<core::is_fixed_point_v<Fixed>>>
    inline std::string to_string(const Fixed &value) {
        constexpr auto div = static_cast<core::detail::uint128>(Fixed::DIV);
        const auto parts = core::detail::split(value.into_inner());
        std::string text;
        if (parts.negative) {
            text.push_back('-');
        }
        text += detail::magnitude_string(parts.magnitude / div);
        if constexpr (Fixed::PRECISION > 0) {
            const std::string fraction = detail::magnitude_string(parts.magnitude % div);
            text.push_back('.');
            text.append(Fixed::PRECISION - fraction.size(), '0');
            text += fraction;
        }
        return text;
    }

} // namespace decfix::io

namespace decfix::core {

    template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
              std::size_t Precision>
    inline std::ostream &
    operator<<(std::ostream &os,
               const fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision> &value) {
        return os << io::to_string(value);
    }

} // namespace decfix::core

namespace std {

    template <typename Inner, typename Unsigned, typename PrevUnsigned, typename PerThing, Inner Div,
              std::size_t Precision>
    struct formatter<decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div, Precision>,
                     char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const decfix::core::fixed_point<Inner, Unsigned, PrevUnsigned, PerThing, Div,
                                                    Precision> &value,
                    FormatContext &ctx) const {
            const std::string text = decfix::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

} // namespace std
