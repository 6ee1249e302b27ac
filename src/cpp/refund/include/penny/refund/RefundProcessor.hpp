/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/refund/RefundAllocator.hpp"
#include "penny/refund/RefundLedger.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

/**
 * Read history from the ledger, compute the refund and record it. A rejected
 * batch leaves the ledger untouched.
 */
class RefundProcessor
{
public:
    explicit RefundProcessor(
        RefundLedger& ledger, RefundAllocator allocator = RefundAllocator{}) noexcept;

    [[nodiscard]] RefundAllocator::ExpectedResult process(
        const TransactionInput& transaction, std::span<const RefundRequest> requests);
    [[nodiscard]] RefundAllocator::ExpectedResult processFullRefund(
        const TransactionInput& transaction);

    [[nodiscard]] const RefundAllocator& allocator() const noexcept { return m_allocator; }

private:
    RefundAllocator::ExpectedResult record(RefundAllocator::ExpectedResult result);

    RefundLedger* m_ledger;
    RefundAllocator m_allocator;
};

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
