/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/refund/RefundProcessor.hpp"

#include "penny/logging/logging.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

RefundProcessor::RefundProcessor(RefundLedger& ledger, RefundAllocator allocator) noexcept
    : m_ledger{&ledger},
      m_allocator{std::move(allocator)}
{}

//-------------------------------------------------------------------------

RefundAllocator::ExpectedResult RefundProcessor::process(
    const TransactionInput& transaction, std::span<const RefundRequest> requests)
{
    const auto history = m_ledger->history(transaction.id);
    return record(m_allocator.computeRefund(transaction, requests, history));
}

//-------------------------------------------------------------------------

RefundAllocator::ExpectedResult RefundProcessor::processFullRefund(
    const TransactionInput& transaction)
{
    const auto history = m_ledger->history(transaction.id);
    return record(m_allocator.previewFullRefund(transaction, history));
}

//-------------------------------------------------------------------------

RefundAllocator::ExpectedResult RefundProcessor::record(RefundAllocator::ExpectedResult result)
{
    if (result) {
        m_ledger->append(result->records);
        logging::logger().debug(
            "RECORDED {} REFUND RECORD(S) FOR {}", result->records.size(), result->transactionId);
    }
    return result;
}

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
