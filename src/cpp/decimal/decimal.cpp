/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/decimal/decimal.hpp"

#include <bdldfp_uint128.h>
#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <source_location>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace penny::util
{

//-------------------------------------------------------------------------

namespace
{

// Significant digits of the mantissa, leading and trailing zeros excluded.
[[nodiscard]] std::size_t significantDigits(std::string_view str) noexcept
{
    const auto mantissaEnd = std::min(str.find_first_of("eE"), str.size());
    const std::string_view mantissa = str.substr(0, mantissaEnd);
    const auto first = mantissa.find_first_of("123456789");
    if (first == std::string_view::npos) {
        return 0;
    }
    const auto last = mantissa.find_last_of("123456789");
    return static_cast<std::size_t>(std::count_if(
        mantissa.begin() + first,
        mantissa.begin() + last + 1,
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
}

[[nodiscard]] bool isEven(decimal_t integral) noexcept
{
    using namespace BloombergLP::bdldfp;
    const decimal_t half = integral / decimal_t{2};
    return DecimalUtil::floor(half) == half;
}

}  // namespace

//-------------------------------------------------------------------------

decimal_t roundHalfEven(decimal_t val, uint32_t decimalPlaces)
{
    using namespace BloombergLP::bdldfp;

    const auto places = static_cast<int>(decimalPlaces);
    const decimal_t scaled = DecimalUtil::multiplyByPowerOf10(val, places);
    decimal_t integral = DecimalUtil::floor(scaled);
    const decimal_t fraction = scaled - integral;
    const decimal_t half = DEC(0.5);

    if (fraction > half || (fraction == half && !isEven(integral))) {
        integral += decimal_t{1};
    }
    return DecimalUtil::multiplyByPowerOf10(integral, -places);
}

//-------------------------------------------------------------------------

std::optional<decimal_t> parseDecimal(std::string_view str)
{
    using namespace BloombergLP::bdldfp;

    if (str.empty()) {
        return {};
    }
    const std::string buf{str};
    decimal_t parsed;
    if (DecimalUtil::parseDecimal128(&parsed, buf.c_str()) != 0) {
        return {};
    }
    if (!DecimalUtil::isFinite(parsed)) {
        return {};
    }
    if (significantDigits(str) > static_cast<std::size_t>(kDecimalDigits)) {
        return {};
    }
    return parsed;
}

//-------------------------------------------------------------------------

decimal_t decimalFromString(std::string_view str)
{
    if (auto parsed = parseDecimal(str)) {
        return *parsed;
    }
    throw std::invalid_argument{fmt::format(
        "{}: '{}' is not a finite decimal amount of at most {} significant digits",
        std::source_location::current().function_name(),
        str,
        kDecimalDigits)};
}

//-------------------------------------------------------------------------

decimal_t decimalFromDouble(double val)
{
    if (!std::isfinite(val)) {
        throw std::invalid_argument{fmt::format(
            "{}: cannot convert non-finite value {} to a decimal amount",
            std::source_location::current().function_name(),
            val)};
    }
    return decimalFromString(fmt::format("{}", val));
}

//-------------------------------------------------------------------------

std::optional<int64_t> toInt64(decimal_t val) noexcept
{
    using namespace BloombergLP::bdldfp;
    using boost::multiprecision::uint128_t;

    int sign{};
    Uint128 parts;
    int exponent{};
    const int cls = DecimalUtil::decompose(&sign, &parts, &exponent, val);

    if (cls == FP_ZERO) {
        return int64_t{};
    }
    if (cls == FP_INFINITE || cls == FP_NAN) {
        return {};
    }

    uint128_t significand = (uint128_t{parts.high()} << 64) | uint128_t{parts.low()};

    for (; exponent < 0; ++exponent) {
        if (significand % 10 != 0) {
            return {};
        }
        significand /= 10;
    }

    const uint128_t limit{static_cast<uint64_t>(std::numeric_limits<int64_t>::max())};
    for (; exponent > 0; --exponent) {
        if (significand > limit) {
            return {};
        }
        significand *= 10;
    }

    if (significand > limit) {
        return {};
    }
    const auto magnitude = static_cast<int64_t>(significand);
    return sign < 0 ? -magnitude : magnitude;
}

//-------------------------------------------------------------------------

}  // namespace penny::util

//-------------------------------------------------------------------------
