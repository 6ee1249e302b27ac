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

[[nodiscard]] std::string_view currencySymbol(std::string_view currency) noexcept;

/**
 * Human-readable rendering of a minor amount: symbol, thousands separators and
 * exactly as many decimals as the currency has ($1,234.56, ¥1,235, KWD 10.123).
 */
[[nodiscard]] std::string formatMoney(
    std::string_view currency,
    MinorAmount minor,
    const CurrencyTable& table = CurrencyTable::defaults());

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
