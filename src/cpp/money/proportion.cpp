/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/proportion.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

MinorAmount calculatePercentage(
    std::string_view currency,
    decimal_t amount,
    decimal_t percent,
    const CurrencyTable& table)
{
    return toMinor(currency, amount * (percent / 100_dec), table);
}

//-------------------------------------------------------------------------

MinorAmount calculateProportion(
    std::string_view currency,
    decimal_t total,
    decimal_t part,
    decimal_t target,
    const CurrencyTable& table)
{
    if (total == 0_dec) {
        return 0;
    }
    return toMinor(currency, part / total * target, table);
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
