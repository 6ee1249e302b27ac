/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace penny::allocation
{

//-------------------------------------------------------------------------

/**
 * Split `total` across `weights` in proportion, largest-remainder method.
 *
 * - result.size() == weights.size()
 * - sum(result) == total, always
 * - zero weights receive zero
 * - all zeros when the weights sum to zero or total is zero
 *
 * Each share is floored, then the leftover units go one each to the lines with
 * the largest fractional residual; equal residuals favour the lower index.
 * Intermediates are exact 128-bit integers. A negative total is allocated as
 * the mirror image of its magnitude.
 *
 * Throws std::invalid_argument on a negative weight.
 */
[[nodiscard]] std::vector<MinorAmount> allocate(std::span<const Weight> weights, MinorAmount total);

//-------------------------------------------------------------------------

}  // namespace penny::allocation

//-------------------------------------------------------------------------
