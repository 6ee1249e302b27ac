/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/money/Quantizer.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

/**
 * Quantize, then scale to an integer count of minor units.
 *
 * Throws std::out_of_range if the scaled amount does not fit in 64 bits.
 */
[[nodiscard]] MinorAmount toMinor(
    std::string_view currency,
    decimal_t amount,
    const CurrencyTable& table = CurrencyTable::defaults());

template<util::DecimalConvertible T>
[[nodiscard]] MinorAmount toMinor(
    std::string_view currency,
    T&& amount,
    const CurrencyTable& table = CurrencyTable::defaults())
{
    return toMinor(currency, util::toDecimal(std::forward<T>(amount)), table);
}

[[nodiscard]] decimal_t fromMinor(
    std::string_view currency,
    MinorAmount minor,
    const CurrencyTable& table = CurrencyTable::defaults());

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
