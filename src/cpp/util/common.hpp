/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/decimal/decimal.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

using namespace penny::literals;

//-------------------------------------------------------------------------

namespace penny
{

// Signed count of a currency's smallest unit (cents, fils, yen).
using MinorAmount = int64_t;
// Relative share used to proportion a total; never negative.
using Weight = int64_t;
using Quantity = int64_t;

}  // namespace penny

//-------------------------------------------------------------------------
