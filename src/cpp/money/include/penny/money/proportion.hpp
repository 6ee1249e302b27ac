/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/money/MinorUnits.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

// amount * percent / 100, in minor units ("100.00" at 8.5% -> 850 cents).
[[nodiscard]] MinorAmount calculatePercentage(
    std::string_view currency,
    decimal_t amount,
    decimal_t percent,
    const CurrencyTable& table = CurrencyTable::defaults());

// part / total * target, in minor units; 0 when total is 0.
[[nodiscard]] MinorAmount calculateProportion(
    std::string_view currency,
    decimal_t total,
    decimal_t part,
    decimal_t target,
    const CurrencyTable& table = CurrencyTable::defaults());

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
