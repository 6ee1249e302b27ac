/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/money/CurrencyTable.hpp"
#include "penny/refund/RefundError.hpp"
#include "penny/refund/RefundRecord.hpp"
#include "penny/tax/TaxLineAllocator.hpp"

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

struct RefundableLine
{
    std::string id;
    decimal_t unitPrice{};
    Quantity quantity{};
    // Tax actually charged on the whole line, as persisted at checkout.
    MinorAmount taxMinor{};

    [[nodiscard]] static RefundableLine fromOrderLine(const tax::OrderLine& line);
};

struct TransactionInput
{
    std::string id;
    std::string currency{"USD"};
    MinorAmount amountMinor{};
    // Order discount taken off the line subtotals before tax.
    MinorAmount discountMinor{};
    MinorAmount tipMinor{};
    MinorAmount surchargeMinor{};
    std::vector<RefundableLine> lines;
};

struct RefundRequest
{
    std::string lineId;
    Quantity quantity{};
};

struct RefundLineResult
{
    std::string lineId;
    Quantity quantity{};
    MinorAmount subtotalMinor{};
    MinorAmount taxMinor{};
    MinorAmount tipMinor{};
    MinorAmount surchargeMinor{};
    MinorAmount totalMinor{};
};

struct RefundResult
{
    std::string transactionId;
    std::vector<RefundLineResult> lines;
    MinorAmount subtotalMinor{};
    MinorAmount taxMinor{};
    MinorAmount tipMinor{};
    MinorAmount surchargeMinor{};
    MinorAmount totalMinor{};
    // True when, together with the history, every unit of every line is refunded.
    bool completesTransaction{};
    std::vector<RefundRecord> records;
};

//-------------------------------------------------------------------------

class RefundAllocator
{
public:
    using ExpectedResult = std::expected<RefundResult, ValidationFailure>;

    explicit RefundAllocator(
        const money::CurrencyTable& table = money::CurrencyTable::defaults()) noexcept;

    /**
     * Validate a batch of refund requests against the transaction and its
     * refund history, then compute each refunded component.
     *
     * The order discount is split across lines by gross subtotal. Line
     * subtotals net of that discount, tax, tip and surcharge are taken as
     * cumulative shares (after this batch minus before it), so any sequence of
     * partial refunds that ends in a full refund returns exactly what was
     * charged. The whole batch is rejected on the first invalid request;
     * nothing is computed in that case.
     *
     * History records belonging to other transactions are ignored. Throws
     * allocation::SumMismatchError if a refund completing the transaction does
     * not add up to amount, tip and surcharge.
     */
    [[nodiscard]] ExpectedResult computeRefund(
        const TransactionInput& transaction,
        std::span<const RefundRequest> requests,
        std::span<const RefundRecord> history) const;

    // Refund every remaining unit of every line.
    [[nodiscard]] ExpectedResult previewFullRefund(
        const TransactionInput& transaction,
        std::span<const RefundRecord> history) const;

    /**
     * Check a batch without computing it. On success returns the requests with
     * duplicate lines merged, in order of first appearance.
     */
    [[nodiscard]] std::expected<std::vector<RefundRequest>, ValidationFailure> validate(
        const TransactionInput& transaction,
        std::span<const RefundRequest> requests,
        std::span<const RefundRecord> history) const;

    [[nodiscard]] static Quantity refundedQuantity(
        std::span<const RefundRecord> history,
        std::string_view transactionId,
        std::string_view lineId) noexcept;

private:
    const money::CurrencyTable* m_table;
};

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
