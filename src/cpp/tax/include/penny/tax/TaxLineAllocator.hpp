/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/money/CurrencyTable.hpp"

//-------------------------------------------------------------------------

namespace penny::tax
{

//-------------------------------------------------------------------------

struct OrderLine
{
    std::string id;
    decimal_t unitPrice{};
    Quantity quantity{};
    std::optional<decimal_t> productTaxRate;
    // Line tax record, owned by the line and written only by TaxLineAllocator.
    std::optional<MinorAmount> taxMinor;

    [[nodiscard]] decimal_t totalPrice() const noexcept
    {
        return unitPrice * decimal_t{static_cast<long long>(quantity)};
    }
};

struct TaxContext
{
    std::string currency{"USD"};
    // Selling location's default rate; absent means the store is not set up for tax.
    std::optional<decimal_t> locationTaxRate;
};

struct LineTax
{
    std::string lineId;
    decimal_t discountedPrice{};
    decimal_t rate{};
    MinorAmount taxMinor{};
};

struct TaxSummary
{
    std::vector<LineTax> lines;
    // Defined as the sum of the line taxes, never computed on its own.
    MinorAmount totalMinor{};
};

struct OrderTotals
{
    MinorAmount subtotalMinor{};
    MinorAmount discountMinor{};
    MinorAmount postDiscountSubtotalMinor{};
    MinorAmount taxMinor{};
    MinorAmount grandTotalMinor{};
};

//-------------------------------------------------------------------------

class TaxLineAllocator
{
public:
    explicit TaxLineAllocator(
        TaxContext context,
        const money::CurrencyTable& table = money::CurrencyTable::defaults());

    /**
     * Compute each line's tax on its discounted, quantized price and store it
     * on the line, overwriting any stale value. The order tax is the sum of
     * the stored line taxes.
     *
     * Without a location tax configuration nothing is computed and the lines
     * are left untouched. Lines are only written once every line has been
     * computed successfully.
     */
    TaxSummary computeLineTaxes(std::span<OrderLine> lines, decimal_t discountFraction = {}) const;

    // Subtotal, discount, tax and grand total; stores line taxes as above.
    OrderTotals computeTotals(std::span<OrderLine> lines, decimal_t discountTotal = {}) const;

    [[nodiscard]] decimal_t subtotal(std::span<const OrderLine> lines) const;
    [[nodiscard]] const TaxContext& context() const noexcept { return m_context; }

    [[nodiscard]] static decimal_t discountFraction(
        decimal_t subtotal, decimal_t postDiscountSubtotal);

private:
    [[nodiscard]] decimal_t effectiveRate(const OrderLine& line) const noexcept;

    TaxContext m_context;
    const money::CurrencyTable* m_table;
};

//-------------------------------------------------------------------------

}  // namespace penny::tax

//-------------------------------------------------------------------------
