/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <msgpack.hpp>

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

/**
 * One successful refund of one line. Records are append-only: a correction is
 * a new record, never an edit. The history of records is the only source of
 * truth for how much of a line has already been refunded.
 */
struct RefundRecord
{
    std::string transactionId;
    std::string lineId;
    Quantity quantity{};
    MinorAmount subtotalMinor{};
    MinorAmount taxMinor{};
    MinorAmount tipMinor{};
    MinorAmount surchargeMinor{};
    MinorAmount totalMinor{};

    bool operator==(const RefundRecord&) const noexcept = default;

    MSGPACK_DEFINE_MAP(
        transactionId,
        lineId,
        quantity,
        subtotalMinor,
        taxMinor,
        tipMinor,
        surchargeMinor,
        totalMinor);
};

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
