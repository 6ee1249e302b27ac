/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/refund/RefundRecord.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

/**
 * Append-only store of refund records. Implementations backed by shared
 * storage must make a history read and the following append atomic per
 * transaction; the engine takes no locks of its own.
 */
class RefundLedger
{
public:
    virtual ~RefundLedger() noexcept = default;

    [[nodiscard]] virtual Quantity refundedQuantity(
        std::string_view transactionId, std::string_view lineId) const = 0;
    [[nodiscard]] virtual std::vector<RefundRecord> history(
        std::string_view transactionId) const = 0;
    virtual void append(std::span<const RefundRecord> records) = 0;
};

//-------------------------------------------------------------------------

class InMemoryRefundLedger : public RefundLedger
{
public:
    InMemoryRefundLedger() noexcept = default;
    explicit InMemoryRefundLedger(std::vector<RefundRecord> records) noexcept;

    [[nodiscard]] Quantity refundedQuantity(
        std::string_view transactionId, std::string_view lineId) const override;
    [[nodiscard]] std::vector<RefundRecord> history(
        std::string_view transactionId) const override;
    void append(std::span<const RefundRecord> records) override;

    [[nodiscard]] std::span<const RefundRecord> records() const noexcept { return m_records; }

private:
    std::vector<RefundRecord> m_records;
};

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
