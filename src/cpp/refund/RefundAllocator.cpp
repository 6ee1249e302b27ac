/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/refund/RefundAllocator.hpp"

#include "penny/allocation/Allocator.hpp"
#include "penny/allocation/validation.hpp"
#include "penny/logging/logging.hpp"
#include "penny/money/MinorUnits.hpp"
#include "penny/money/format.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <array>

//-------------------------------------------------------------------------

namespace penny::refund
{

//-------------------------------------------------------------------------

namespace
{

using wide_t = boost::multiprecision::int128_t;

// Part of a line-level amount (tax, discount) attributable to its first
// `refunded` units.
[[nodiscard]] MinorAmount lineShare(
    MinorAmount lineAmount, Quantity refunded, Quantity ordered)
{
    if (ordered <= 0 || refunded <= 0) {
        return 0;
    }
    if (refunded >= ordered) {
        return lineAmount;
    }
    const wide_t share = wide_t{lineAmount} * wide_t{refunded} / wide_t{ordered};
    return share.convert_to<MinorAmount>();
}

// Part of a transaction-level amount (tip, surcharge) attributable to a
// cumulative refunded subtotal.
[[nodiscard]] MinorAmount transactionShare(
    MinorAmount amount, MinorAmount refundedSubtotal, MinorAmount originalSubtotal)
{
    if (originalSubtotal <= 0 || refundedSubtotal <= 0) {
        return 0;
    }
    if (refundedSubtotal >= originalSubtotal) {
        return amount;
    }
    const std::array<Weight, 2> weights{refundedSubtotal, originalSubtotal - refundedSubtotal};
    return allocation::allocate(weights, amount).front();
}

[[nodiscard]] ValidationFailure makeFailure(
    RefundErrorCode code,
    std::string_view lineId,
    Quantity requested,
    Quantity available,
    Quantity alreadyRefunded,
    std::string message)
{
    return ValidationFailure{
        .code = code,
        .lineId = std::string{lineId},
        .requested = requested,
        .available = available,
        .alreadyRefunded = alreadyRefunded,
        .message = std::move(message)
    };
}

}  // namespace

//-------------------------------------------------------------------------

RefundableLine RefundableLine::fromOrderLine(const tax::OrderLine& line)
{
    return RefundableLine{
        .id = line.id,
        .unitPrice = line.unitPrice,
        .quantity = line.quantity,
        .taxMinor = line.taxMinor.value_or(0)
    };
}

//-------------------------------------------------------------------------

RefundAllocator::RefundAllocator(const money::CurrencyTable& table) noexcept
    : m_table{&table}
{}

//-------------------------------------------------------------------------

RefundAllocator::ExpectedResult RefundAllocator::computeRefund(
    const TransactionInput& transaction,
    std::span<const RefundRequest> requests,
    std::span<const RefundRecord> history) const
{
    const auto merged = validate(transaction, requests, history);
    if (!merged) {
        logging::logger().warn(
            "REFUND REJECTED : TRANSACTION {} : {}", transaction.id, merged.error());
        return std::unexpected{merged.error()};
    }

    const auto& currency = transaction.currency;
    const auto grossSubtotal = [&](const RefundableLine& line, Quantity quantity) {
        return money::toMinor(
            currency, line.unitPrice * decimal_t{static_cast<long long>(quantity)}, *m_table);
    };

    const auto lineSubtotals = transaction.lines
        | views::transform([&](const RefundableLine& line) {
            return grossSubtotal(line, line.quantity);
        })
        | ranges::to<std::vector<Weight>>;
    const auto lineDiscounts = allocation::allocate(lineSubtotals, transaction.discountMinor);
    const MinorAmount originalSubtotal =
        ranges::accumulate(lineSubtotals, MinorAmount{}) - transaction.discountMinor;

    // Net subtotal of the first `refunded` units of line `idx`.
    const auto netSubtotal = [&](std::size_t idx, Quantity refunded) {
        const auto& line = transaction.lines[idx];
        return grossSubtotal(line, refunded)
            - lineShare(lineDiscounts[idx], refunded, line.quantity);
    };

    MinorAmount previousSubtotal{};
    for (const auto& record : history) {
        if (record.transactionId == transaction.id) {
            previousSubtotal += record.subtotalMinor;
        }
    }

    RefundResult result{.transactionId = transaction.id};
    result.lines.reserve(merged->size());
    for (const auto& request : *merged) {
        const auto idx = static_cast<std::size_t>(ranges::distance(
            transaction.lines.begin(),
            ranges::find(transaction.lines, request.lineId, &RefundableLine::id)));
        const auto& line = transaction.lines[idx];
        const Quantity before = refundedQuantity(history, transaction.id, line.id);
        const Quantity after = before + request.quantity;

        RefundLineResult lineResult{
            .lineId = line.id,
            .quantity = request.quantity,
            .subtotalMinor = netSubtotal(idx, after) - netSubtotal(idx, before),
            .taxMinor = lineShare(line.taxMinor, after, line.quantity)
                - lineShare(line.taxMinor, before, line.quantity)
        };
        result.subtotalMinor += lineResult.subtotalMinor;
        result.taxMinor += lineResult.taxMinor;
        result.lines.push_back(std::move(lineResult));
    }

    const MinorAmount refundedSubtotal = previousSubtotal + result.subtotalMinor;
    result.tipMinor =
        transactionShare(transaction.tipMinor, refundedSubtotal, originalSubtotal)
        - transactionShare(transaction.tipMinor, previousSubtotal, originalSubtotal);
    result.surchargeMinor =
        transactionShare(transaction.surchargeMinor, refundedSubtotal, originalSubtotal)
        - transactionShare(transaction.surchargeMinor, previousSubtotal, originalSubtotal);

    const auto weights = result.lines
        | views::transform(&RefundLineResult::subtotalMinor)
        | ranges::to<std::vector<Weight>>;
    const auto lineTips = allocation::allocate(weights, result.tipMinor);
    const auto lineSurcharges = allocation::allocate(weights, result.surchargeMinor);

    std::vector<MinorAmount> lineTotals;
    lineTotals.reserve(result.lines.size());
    for (auto&& [lineResult, tip, surcharge] : views::zip(result.lines, lineTips, lineSurcharges)) {
        lineResult.tipMinor = tip;
        lineResult.surchargeMinor = surcharge;
        lineResult.totalMinor = lineResult.subtotalMinor + lineResult.taxMinor
            + lineResult.tipMinor + lineResult.surchargeMinor;
        lineTotals.push_back(lineResult.totalMinor);
        logging::logger().debug(
            "REFUND LINE {} x{} : SUBTOTAL {} TAX {} TIP {} SURCHARGE {}",
            lineResult.lineId, lineResult.quantity,
            lineResult.subtotalMinor, lineResult.taxMinor,
            lineResult.tipMinor, lineResult.surchargeMinor);
    }
    result.totalMinor =
        result.subtotalMinor + result.taxMinor + result.tipMinor + result.surchargeMinor;

    allocation::enforceSum(lineTips, result.tipMinor, "refund tip");
    allocation::enforceSum(lineSurcharges, result.surchargeMinor, "refund surcharge");
    allocation::enforceSum(lineTotals, result.totalMinor, "refund total");

    result.completesTransaction = ranges::all_of(transaction.lines, [&](const auto& line) {
        const auto it = ranges::find(*merged, line.id, &RefundRequest::lineId);
        const Quantity requested = it != merged->end() ? it->quantity : 0;
        return refundedQuantity(history, transaction.id, line.id) + requested >= line.quantity;
    });
    if (result.completesTransaction) {
        std::vector<MinorAmount> refundedTotals{result.totalMinor};
        for (const auto& record : history) {
            if (record.transactionId == transaction.id) {
                refundedTotals.push_back(record.totalMinor);
            }
        }
        allocation::enforceSum(
            refundedTotals,
            transaction.amountMinor + transaction.tipMinor + transaction.surchargeMinor,
            fmt::format("full refund of transaction {}", transaction.id));
    }

    result.records = result.lines
        | views::transform([&](const RefundLineResult& lineResult) {
            return RefundRecord{
                .transactionId = transaction.id,
                .lineId = lineResult.lineId,
                .quantity = lineResult.quantity,
                .subtotalMinor = lineResult.subtotalMinor,
                .taxMinor = lineResult.taxMinor,
                .tipMinor = lineResult.tipMinor,
                .surchargeMinor = lineResult.surchargeMinor,
                .totalMinor = lineResult.totalMinor
            };
        })
        | ranges::to<std::vector>;

    logging::logger().info(
        "REFUND {} : SUBTOTAL {} TAX {} TIP {} SURCHARGE {} TOTAL {}",
        transaction.id,
        money::formatMoney(currency, result.subtotalMinor, *m_table),
        money::formatMoney(currency, result.taxMinor, *m_table),
        money::formatMoney(currency, result.tipMinor, *m_table),
        money::formatMoney(currency, result.surchargeMinor, *m_table),
        money::formatMoney(currency, result.totalMinor, *m_table));

    return result;
}

//-------------------------------------------------------------------------

RefundAllocator::ExpectedResult RefundAllocator::previewFullRefund(
    const TransactionInput& transaction,
    std::span<const RefundRecord> history) const
{
    std::vector<RefundRequest> requests;
    for (const auto& line : transaction.lines) {
        const Quantity remaining =
            line.quantity - refundedQuantity(history, transaction.id, line.id);
        if (remaining > 0) {
            requests.push_back(RefundRequest{.lineId = line.id, .quantity = remaining});
        }
    }
    if (requests.empty() && !transaction.lines.empty()) {
        const auto& first = transaction.lines.front();
        return std::unexpected{makeFailure(
            RefundErrorCode::ALREADY_REFUNDED,
            first.id,
            0,
            0,
            refundedQuantity(history, transaction.id, first.id),
            fmt::format("Transaction {} has already been fully refunded", transaction.id))};
    }
    return computeRefund(transaction, requests, history);
}

//-------------------------------------------------------------------------

std::expected<std::vector<RefundRequest>, ValidationFailure> RefundAllocator::validate(
    const TransactionInput& transaction,
    std::span<const RefundRequest> requests,
    std::span<const RefundRecord> history) const
{
    if (requests.empty()) {
        return std::unexpected{makeFailure(
            RefundErrorCode::EMPTY_REQUEST, {}, 0, 0, 0, "No items selected for refund")};
    }

    MinorAmount grossSubtotal{};
    for (const auto& line : transaction.lines) {
        if (line.unitPrice < decimal_t{} || line.quantity < 0) {
            return std::unexpected{makeFailure(
                RefundErrorCode::INVALID_TRANSACTION,
                line.id,
                0,
                line.quantity,
                0,
                fmt::format(
                    "Line {} has a negative price or quantity ({} x {})",
                    line.id, line.unitPrice, line.quantity))};
        }
        grossSubtotal += money::toMinor(
            transaction.currency,
            line.unitPrice * decimal_t{static_cast<long long>(line.quantity)},
            *m_table);
    }
    if (transaction.discountMinor < 0 || transaction.discountMinor > grossSubtotal) {
        return std::unexpected{makeFailure(
            RefundErrorCode::INVALID_TRANSACTION,
            {},
            0,
            0,
            0,
            fmt::format(
                "Discount {} of transaction {} is outside [0, {}]",
                transaction.discountMinor, transaction.id, grossSubtotal))};
    }

    std::vector<RefundRequest> merged;
    for (const auto& request : requests) {
        if (request.quantity <= 0) {
            return std::unexpected{makeFailure(
                RefundErrorCode::NON_POSITIVE_QUANTITY,
                request.lineId,
                request.quantity,
                0,
                0,
                "Quantity must be positive")};
        }
        if (auto it = ranges::find(merged, request.lineId, &RefundRequest::lineId);
            it != merged.end()) {
            it->quantity += request.quantity;
        }
        else {
            merged.push_back(request);
        }
    }

    for (const auto& request : merged) {
        const auto line = ranges::find(transaction.lines, request.lineId, &RefundableLine::id);
        if (line == transaction.lines.end()) {
            return std::unexpected{makeFailure(
                RefundErrorCode::UNKNOWN_LINE,
                request.lineId,
                request.quantity,
                0,
                0,
                fmt::format(
                    "Line {} is not part of transaction {}", request.lineId, transaction.id))};
        }
        if (request.quantity > line->quantity) {
            return std::unexpected{makeFailure(
                RefundErrorCode::EXCEEDS_ORDERED,
                line->id,
                request.quantity,
                line->quantity,
                0,
                fmt::format(
                    "Cannot refund {} units - only {} ordered",
                    request.quantity, line->quantity))};
        }
        const Quantity already = refundedQuantity(history, transaction.id, line->id);
        const Quantity remaining = line->quantity - already;
        if (remaining <= 0) {
            return std::unexpected{makeFailure(
                RefundErrorCode::ALREADY_REFUNDED,
                line->id,
                request.quantity,
                0,
                already,
                fmt::format(
                    "Line {} has already been refunded ({} of {} units)",
                    line->id, already, line->quantity))};
        }
        if (request.quantity > remaining) {
            return std::unexpected{makeFailure(
                RefundErrorCode::EXCEEDS_REMAINING,
                line->id,
                request.quantity,
                remaining,
                already,
                fmt::format(
                    "Only {} units available to refund ({} already refunded)",
                    remaining, already))};
        }
    }

    return merged;
}

//-------------------------------------------------------------------------

Quantity RefundAllocator::refundedQuantity(
    std::span<const RefundRecord> history,
    std::string_view transactionId,
    std::string_view lineId) noexcept
{
    Quantity total{};
    for (const auto& record : history) {
        if (record.transactionId == transactionId && record.lineId == lineId) {
            total += record.quantity;
        }
    }
    return total;
}

//-------------------------------------------------------------------------

}  // namespace penny::refund

//-------------------------------------------------------------------------
