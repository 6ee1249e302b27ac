/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

enum class RefundErrorCode : uint32_t
{
    EMPTY_REQUEST,
    NON_POSITIVE_QUANTITY,
    UNKNOWN_LINE,
    EXCEEDS_ORDERED,
    ALREADY_REFUNDED,
    EXCEEDS_REMAINING,
    INVALID_TRANSACTION
};

// Rejection of a whole refund batch, with enough context to show the user.
struct ValidationFailure
{
    RefundErrorCode code;
    std::string lineId;
    Quantity requested{};
    Quantity available{};
    Quantity alreadyRefunded{};
    std::string message;
};

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<penny::refund::ValidationFailure>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const penny::refund::ValidationFailure& failure, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} (line {}): {}",
            magic_enum::enum_name(failure.code),
            failure.lineId,
            failure.message);
    }
};

//-------------------------------------------------------------------------
