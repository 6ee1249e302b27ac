/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/decimal/decimal.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace penny
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace penny

//-------------------------------------------------------------------------
