/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/money/CurrencyTable.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

/**
 * Round an amount onto the currency's minor-unit grid using banker's rounding
 * (10.125 -> 10.12, 10.135 -> 10.14).
 */
[[nodiscard]] decimal_t quantize(
    std::string_view currency,
    decimal_t amount,
    const CurrencyTable& table = CurrencyTable::defaults());

template<util::DecimalConvertible T>
[[nodiscard]] decimal_t quantize(
    std::string_view currency,
    T&& amount,
    const CurrencyTable& table = CurrencyTable::defaults())
{
    return quantize(currency, util::toDecimal(std::forward<T>(amount)), table);
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
