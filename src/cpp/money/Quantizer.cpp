/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/Quantizer.hpp"

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

decimal_t quantize(std::string_view currency, decimal_t amount, const CurrencyTable& table)
{
    return util::roundHalfEven(amount, table.exponent(currency));
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
