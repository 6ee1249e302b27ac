/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/refund/RefundAllocator.hpp"
#include "penny/tax/TaxLineAllocator.hpp"

//-------------------------------------------------------------------------

namespace penny::io
{

//-------------------------------------------------------------------------

struct PaymentInput
{
    std::string transactionId;
    decimal_t tip{};
    decimal_t surcharge{};
    // Defaults to the order's grand total.
    std::optional<decimal_t> amount;
};

/**
 * One order as read from XML:
 *
 * <Order id="1001" currency="USD" locationTaxRate="0.10" discountTotal="0.00">
 *   <Line id="L1" unitPrice="15.99" quantity="2" taxRate="0.08"/>
 *   <Payment transactionId="T1" tip="5.00" surcharge="1.88" amount="68.95"/>
 *   <Refund line="L1" quantity="1"/>
 *   <RefundRecord transactionId="T1" line="L1" quantity="1" subtotal="1599"
 *                 tax="160" tip="128" surcharge="48" total="1935"/>
 * </Order>
 *
 * Decimal attributes are in major units; RefundRecord amounts are minor units.
 */
struct OrderFile
{
    std::string id;
    tax::TaxContext taxContext;
    decimal_t discountTotal{};
    std::vector<tax::OrderLine> lines;
    std::optional<PaymentInput> payment;
    std::vector<refund::RefundRequest> refunds;
    std::vector<refund::RefundRecord> history;

    [[nodiscard]] static OrderFile fromXML(
        pugi::xml_node node, std::string_view defaultCurrency = "USD");
    [[nodiscard]] static OrderFile fromFile(
        const fs::path& path, std::string_view defaultCurrency = "USD");
};

/**
 * Compute line taxes on the order and describe its payment for refunding.
 * Throws std::invalid_argument if the order has no payment.
 */
[[nodiscard]] refund::TransactionInput buildTransaction(
    OrderFile& order,
    const money::CurrencyTable& table = money::CurrencyTable::defaults());

//-------------------------------------------------------------------------

}  // namespace penny::io

//-------------------------------------------------------------------------
