/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/refund/RefundLedger.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

InMemoryRefundLedger::InMemoryRefundLedger(std::vector<RefundRecord> records) noexcept
    : m_records{std::move(records)}
{}

//-------------------------------------------------------------------------

Quantity InMemoryRefundLedger::refundedQuantity(
    std::string_view transactionId, std::string_view lineId) const
{
    return ranges::accumulate(
        m_records
            | views::filter([&](const RefundRecord& record) {
                return record.transactionId == transactionId && record.lineId == lineId;
            })
            | views::transform(&RefundRecord::quantity),
        Quantity{});
}

//-------------------------------------------------------------------------

std::vector<RefundRecord> InMemoryRefundLedger::history(std::string_view transactionId) const
{
    return m_records
        | views::filter([&](const RefundRecord& record) {
            return record.transactionId == transactionId;
        })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

void InMemoryRefundLedger::append(std::span<const RefundRecord> records)
{
    m_records.insert(m_records.end(), records.begin(), records.end());
}

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
