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

struct SumMismatch
{
    MinorAmount expected{};
    MinorAmount actual{};
    MinorAmount tolerance{};
    std::string context;

    // actual - expected, saturated to the 64-bit range.
    [[nodiscard]] MinorAmount difference() const noexcept;
    [[nodiscard]] std::string message() const;
};

// An allocation invariant was broken; this is a bug, not bad input.
class SumMismatchError : public std::logic_error
{
public:
    explicit SumMismatchError(SumMismatch mismatch);

    [[nodiscard]] const SumMismatch& mismatch() const noexcept { return m_mismatch; }

private:
    SumMismatch m_mismatch;
};

//-------------------------------------------------------------------------

[[nodiscard]] std::expected<void, SumMismatch> validateSum(
    std::span<const MinorAmount> components,
    MinorAmount expected,
    MinorAmount tolerance = 0,
    std::string_view context = {});

/**
 * Exact-match form used inside the consumers. Logs at critical and throws
 * SumMismatchError on any difference.
 */
void enforceSum(
    std::span<const MinorAmount> components,
    MinorAmount expected,
    std::string_view context = {});

//-------------------------------------------------------------------------

}  // namespace penny::allocation

//-------------------------------------------------------------------------
