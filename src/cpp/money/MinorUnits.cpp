/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/MinorUnits.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

MinorAmount toMinor(std::string_view currency, decimal_t amount, const CurrencyTable& table)
{
    using namespace BloombergLP::bdldfp;

    const uint32_t exponent = table.exponent(currency);
    const decimal_t quantized = util::roundHalfEven(amount, exponent);
    const decimal_t scaled =
        DecimalUtil::multiplyByPowerOf10(quantized, static_cast<int>(exponent));

    if (auto minor = util::toInt64(scaled)) {
        return *minor;
    }
    throw std::out_of_range{fmt::format(
        "{}: {} {} is not representable in 64-bit minor units",
        std::source_location::current().function_name(),
        amount,
        currency)};
}

//-------------------------------------------------------------------------

decimal_t fromMinor(std::string_view currency, MinorAmount minor, const CurrencyTable& table)
{
    using namespace BloombergLP::bdldfp;
    return DecimalUtil::makeDecimal128(
        static_cast<long long>(minor), -static_cast<int>(table.exponent(currency)));
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
