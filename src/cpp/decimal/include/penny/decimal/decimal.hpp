/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <spanstream>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DL(lit)

//-------------------------------------------------------------------------

namespace penny
{

// 34 significant digits, enough to hold any 64-bit minor amount at any
// supported exponent without rounding.
using decimal_t = BloombergLP::bdldfp::Decimal128;

inline constexpr int kDecimalDigits = 34;

}  // namespace penny

//-------------------------------------------------------------------------

namespace penny::util
{

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t pow10(int32_t exponent)
{
    return BloombergLP::bdldfp::DecimalUtil::multiplyByPowerOf10(decimal_t{1}, exponent);
}

[[nodiscard]] inline bool isIntegral(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::floor(val) == val;
}

/**
 * Round to the given number of fractional digits, ties going to the even
 * neighbour. Symmetric around zero.
 */
[[nodiscard]] decimal_t roundHalfEven(decimal_t val, uint32_t decimalPlaces);

// Empty when the text is malformed, not finite, or carries more significant
// digits than decimal_t holds exactly.
[[nodiscard]] std::optional<decimal_t> parseDecimal(std::string_view str);

[[nodiscard]] decimal_t decimalFromString(std::string_view str);

// Goes through the shortest round-trip text of the double, not its binary value.
[[nodiscard]] decimal_t decimalFromDouble(double val);

[[nodiscard]] std::optional<int64_t> toInt64(decimal_t val) noexcept;

//-------------------------------------------------------------------------

template<typename T>
concept DecimalConvertible =
    std::same_as<std::remove_cvref_t<T>, decimal_t>
    || (std::integral<std::remove_cvref_t<T>> && !std::same_as<std::remove_cvref_t<T>, bool>)
    || std::floating_point<std::remove_cvref_t<T>>
    || std::convertible_to<T, std::string_view>;

template<DecimalConvertible T>
[[nodiscard]] decimal_t toDecimal(T&& val)
{
    using U = std::remove_cvref_t<T>;
    if constexpr (std::same_as<U, decimal_t>) {
        return val;
    } else if constexpr (std::integral<U>) {
        return decimal_t{static_cast<long long>(val)};
    } else if constexpr (std::floating_point<U>) {
        return decimalFromDouble(static_cast<double>(val));
    } else {
        return decimalFromString(std::string_view{val});
    }
}

}  // namespace penny::util

//-------------------------------------------------------------------------

namespace penny::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace penny::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<penny::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(penny::decimal_t val, FormatContext& ctx) const
    {
        using namespace penny::literals;
        char buf[64]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
