/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/io/OrderFile.hpp"

#include "penny/money/MinorUnits.hpp"

//-------------------------------------------------------------------------

namespace penny::io
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] pugi::xml_attribute requireAttribute(
    pugi::xml_node node, const char* name, std::string_view ctx)
{
    pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument '{}' on '{}'", ctx, name, node.name())};
    }
    return attr;
}

[[nodiscard]] decimal_t decimalAttribute(
    pugi::xml_node node, const char* name, std::string_view ctx)
{
    return util::decimalFromString(requireAttribute(node, name, ctx).as_string());
}

[[nodiscard]] std::optional<decimal_t> optionalDecimalAttribute(
    pugi::xml_node node, const char* name)
{
    pugi::xml_attribute attr = node.attribute(name);
    return attr ? std::make_optional(util::decimalFromString(attr.as_string())) : std::nullopt;
}

}  // namespace

//-------------------------------------------------------------------------

OrderFile OrderFile::fromXML(pugi::xml_node node, std::string_view defaultCurrency)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node || std::string_view{node.name()} != "Order") {
        throw std::invalid_argument{fmt::format(
            "{}: Expected an 'Order' node, got '{}'", ctx, node.name())};
    }

    OrderFile order{
        .id = node.attribute("id").as_string(),
        .taxContext = tax::TaxContext{
            .currency = money::normalizeCurrencyCode(
                node.attribute("currency").as_string(std::string{defaultCurrency}.c_str())),
            .locationTaxRate = optionalDecimalAttribute(node, "locationTaxRate")
        },
        .discountTotal = optionalDecimalAttribute(node, "discountTotal").value_or(decimal_t{})
    };

    for (pugi::xml_node lineNode : node.children("Line")) {
        order.lines.push_back(tax::OrderLine{
            .id = requireAttribute(lineNode, "id", ctx).as_string(),
            .unitPrice = decimalAttribute(lineNode, "unitPrice", ctx),
            .quantity = requireAttribute(lineNode, "quantity", ctx).as_llong(),
            .productTaxRate = optionalDecimalAttribute(lineNode, "taxRate")
        });
    }

    if (pugi::xml_node paymentNode = node.child("Payment")) {
        order.payment = PaymentInput{
            .transactionId = requireAttribute(paymentNode, "transactionId", ctx).as_string(),
            .tip = optionalDecimalAttribute(paymentNode, "tip").value_or(decimal_t{}),
            .surcharge = optionalDecimalAttribute(paymentNode, "surcharge").value_or(decimal_t{}),
            .amount = optionalDecimalAttribute(paymentNode, "amount")
        };
    }

    for (pugi::xml_node refundNode : node.children("Refund")) {
        order.refunds.push_back(refund::RefundRequest{
            .lineId = requireAttribute(refundNode, "line", ctx).as_string(),
            .quantity = requireAttribute(refundNode, "quantity", ctx).as_llong()
        });
    }

    for (pugi::xml_node recordNode : node.children("RefundRecord")) {
        order.history.push_back(refund::RefundRecord{
            .transactionId = requireAttribute(recordNode, "transactionId", ctx).as_string(),
            .lineId = requireAttribute(recordNode, "line", ctx).as_string(),
            .quantity = requireAttribute(recordNode, "quantity", ctx).as_llong(),
            .subtotalMinor = recordNode.attribute("subtotal").as_llong(),
            .taxMinor = recordNode.attribute("tax").as_llong(),
            .tipMinor = recordNode.attribute("tip").as_llong(),
            .surchargeMinor = recordNode.attribute("surcharge").as_llong(),
            .totalMinor = recordNode.attribute("total").as_llong()
        });
    }

    return order;
}

//-------------------------------------------------------------------------

OrderFile OrderFile::fromFile(const fs::path& path, std::string_view defaultCurrency)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to load '{}': {} (offset {})",
            ctx, path.c_str(), result.description(), result.offset)};
    }
    return fromXML(doc.child("Order"), defaultCurrency);
}

//-------------------------------------------------------------------------

refund::TransactionInput buildTransaction(OrderFile& order, const money::CurrencyTable& table)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!order.payment) {
        throw std::invalid_argument{fmt::format("{}: Order {} has no payment", ctx, order.id)};
    }

    const auto& currency = order.taxContext.currency;
    const tax::TaxLineAllocator taxes{order.taxContext, table};
    const auto totals = taxes.computeTotals(order.lines, order.discountTotal);

    const auto& payment = *order.payment;
    return refund::TransactionInput{
        .id = payment.transactionId,
        .currency = currency,
        .amountMinor = payment.amount
            ? money::toMinor(currency, *payment.amount, table)
            : totals.grandTotalMinor,
        .discountMinor = totals.discountMinor,
        .tipMinor = money::toMinor(currency, payment.tip, table),
        .surchargeMinor = money::toMinor(currency, payment.surcharge, table),
        .lines = order.lines
            | views::transform(&refund::RefundableLine::fromOrderLine)
            | ranges::to<std::vector>
    };
}

//-------------------------------------------------------------------------

}  // namespace penny::io

//-------------------------------------------------------------------------
