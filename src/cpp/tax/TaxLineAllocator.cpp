/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/tax/TaxLineAllocator.hpp"

#include "penny/logging/logging.hpp"
#include "penny/money/MinorUnits.hpp"
#include "penny/money/format.hpp"

//-------------------------------------------------------------------------

namespace penny::tax
{

//-------------------------------------------------------------------------

TaxLineAllocator::TaxLineAllocator(TaxContext context, const money::CurrencyTable& table)
    : m_context{std::move(context)},
      m_table{&table}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_context.locationTaxRate && *m_context.locationTaxRate < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Location tax rate must be non-negative, was {}",
            ctx, *m_context.locationTaxRate)};
    }
}

//-------------------------------------------------------------------------

TaxSummary TaxLineAllocator::computeLineTaxes(
    std::span<OrderLine> lines, decimal_t discountFraction) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (discountFraction < 0_dec || discountFraction > 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Discount fraction should be within [0, 1], was {}", ctx, discountFraction)};
    }

    TaxSummary summary;
    if (!m_context.locationTaxRate) {
        logging::logger().debug("No location tax configured, order tax is zero");
        return summary;
    }

    const auto& currency = m_context.currency;
    const decimal_t keptFraction = 1_dec - discountFraction;

    summary.lines.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.quantity < 0 || line.unitPrice < 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: Line {} has a negative price or quantity ({} x {})",
                ctx, line.id, line.unitPrice, line.quantity)};
        }
        const decimal_t rate = effectiveRate(line);
        if (rate < 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: Line {} has a negative tax rate {}", ctx, line.id, rate)};
        }

        const decimal_t discountedPrice =
            money::quantize(currency, line.totalPrice() * keptFraction, *m_table);
        const decimal_t lineTax = money::quantize(currency, discountedPrice * rate, *m_table);

        summary.lines.push_back(LineTax{
            .lineId = line.id,
            .discountedPrice = discountedPrice,
            .rate = rate,
            .taxMinor = money::toMinor(currency, lineTax, *m_table)
        });
    }

    for (auto&& [line, lineTax] : views::zip(lines, summary.lines)) {
        line.taxMinor = lineTax.taxMinor;
        summary.totalMinor += lineTax.taxMinor;
        logging::logger().debug(
            "LINE {} : {} @ {} -> TAX {}",
            line.id, lineTax.discountedPrice, lineTax.rate,
            money::formatMoney(currency, lineTax.taxMinor, *m_table));
    }

    return summary;
}

//-------------------------------------------------------------------------

OrderTotals TaxLineAllocator::computeTotals(
    std::span<OrderLine> lines, decimal_t discountTotal) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto& currency = m_context.currency;
    const decimal_t orderSubtotal = subtotal(lines);
    const decimal_t discount = money::quantize(currency, discountTotal, *m_table);
    if (discount < 0_dec || discount > orderSubtotal) {
        throw std::invalid_argument{fmt::format(
            "{}: Discount total {} must be within [0, {}]", ctx, discount, orderSubtotal)};
    }
    const decimal_t postDiscount = orderSubtotal - discount;

    const auto taxes = computeLineTaxes(lines, discountFraction(orderSubtotal, postDiscount));

    OrderTotals totals{
        .subtotalMinor = money::toMinor(currency, orderSubtotal, *m_table),
        .discountMinor = money::toMinor(currency, discount, *m_table),
        .postDiscountSubtotalMinor = money::toMinor(currency, postDiscount, *m_table),
        .taxMinor = taxes.totalMinor
    };
    totals.grandTotalMinor = totals.postDiscountSubtotalMinor + totals.taxMinor;

    logging::logger().info(
        "ORDER TOTALS : SUBTOTAL {} DISCOUNT {} TAX {} GRAND TOTAL {}",
        money::formatMoney(currency, totals.subtotalMinor, *m_table),
        money::formatMoney(currency, totals.discountMinor, *m_table),
        money::formatMoney(currency, totals.taxMinor, *m_table),
        money::formatMoney(currency, totals.grandTotalMinor, *m_table));

    return totals;
}

//-------------------------------------------------------------------------

decimal_t TaxLineAllocator::subtotal(std::span<const OrderLine> lines) const
{
    decimal_t sum{};
    for (const auto& line : lines) {
        sum += line.totalPrice();
    }
    return money::quantize(m_context.currency, sum, *m_table);
}

//-------------------------------------------------------------------------

decimal_t TaxLineAllocator::discountFraction(decimal_t subtotal, decimal_t postDiscountSubtotal)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (postDiscountSubtotal < 0_dec || postDiscountSubtotal > subtotal) {
        throw std::invalid_argument{fmt::format(
            "{}: Post-discount subtotal {} must be within [0, {}]",
            ctx, postDiscountSubtotal, subtotal)};
    }
    if (subtotal == 0_dec || postDiscountSubtotal == subtotal) {
        return 0_dec;
    }
    return (subtotal - postDiscountSubtotal) / subtotal;
}

//-------------------------------------------------------------------------

decimal_t TaxLineAllocator::effectiveRate(const OrderLine& line) const noexcept
{
    return line.productTaxRate.value_or(m_context.locationTaxRate.value_or(0_dec));
}

//-------------------------------------------------------------------------

}  // namespace penny::tax

//-------------------------------------------------------------------------
