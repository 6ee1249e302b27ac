/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/allocation/Allocator.hpp"
#include "penny/config/EngineConfig.hpp"
#include "penny/io/OrderFile.hpp"
#include "penny/money/MinorUnits.hpp"
#include "penny/money/format.hpp"
#include "penny/refund/RefundProcessor.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>
#include <fmt/ranges.h>

//-------------------------------------------------------------------------

namespace
{

using namespace penny;

//-------------------------------------------------------------------------

int runAllocate(const std::vector<Weight>& weights, MinorAmount total)
{
    const auto shares = allocation::allocate(weights, total);
    fmt::print("{}\n", fmt::join(shares, ","));
    return 0;
}

//-------------------------------------------------------------------------

int runConvert(const config::EngineConfig& config, std::string currency, const std::string& amount)
{
    if (currency.empty()) {
        currency = config.defaultCurrency;
    }
    const decimal_t value = util::decimalFromString(amount);
    const auto& table = config.currencies;
    const MinorAmount minor = money::toMinor(currency, value, table);
    fmt::print(
        "{} {} -> {} ({} minor units, exponent {})\n",
        money::normalizeCurrencyCode(currency),
        value,
        money::quantize(currency, value, table),
        minor,
        table.exponent(currency));
    return 0;
}

//-------------------------------------------------------------------------

int runTax(const config::EngineConfig& config, const fs::path& orderPath)
{
    auto order = io::OrderFile::fromFile(orderPath, config.defaultCurrency);
    const auto& currency = order.taxContext.currency;
    const auto& table = config.currencies;

    const tax::TaxLineAllocator taxes{order.taxContext, table};
    const auto totals = taxes.computeTotals(order.lines, order.discountTotal);

    for (const auto& line : order.lines) {
        fmt::print(
            "{:<12} {:>4} x {} tax {:>12}\n",
            line.id,
            line.quantity,
            line.unitPrice,
            money::formatMoney(currency, line.taxMinor.value_or(0), table));
    }
    fmt::print("subtotal    {}\n", money::formatMoney(currency, totals.subtotalMinor, table));
    fmt::print("discount    {}\n", money::formatMoney(currency, totals.discountMinor, table));
    fmt::print("tax         {}\n", money::formatMoney(currency, totals.taxMinor, table));
    fmt::print("grand total {}\n", money::formatMoney(currency, totals.grandTotalMinor, table));
    return 0;
}

//-------------------------------------------------------------------------

int runRefund(const config::EngineConfig& config, const fs::path& orderPath, bool full)
{
    auto order = io::OrderFile::fromFile(orderPath, config.defaultCurrency);
    const auto& table = config.currencies;
    const auto transaction = io::buildTransaction(order, table);

    refund::InMemoryRefundLedger ledger{order.history};
    refund::RefundProcessor processor{ledger, refund::RefundAllocator{table}};

    const auto result = full
        ? processor.processFullRefund(transaction)
        : processor.process(transaction, order.refunds);
    if (!result) {
        fmt::print(stderr, "refund rejected: {}\n", result.error());
        return 2;
    }

    const auto& currency = transaction.currency;
    for (const auto& line : result->lines) {
        fmt::print(
            "{:<12} x{:<4} subtotal {:>12} tax {:>10} tip {:>10} surcharge {:>10} total {:>12}\n",
            line.lineId,
            line.quantity,
            money::formatMoney(currency, line.subtotalMinor, table),
            money::formatMoney(currency, line.taxMinor, table),
            money::formatMoney(currency, line.tipMinor, table),
            money::formatMoney(currency, line.surchargeMinor, table),
            money::formatMoney(currency, line.totalMinor, table));
    }
    fmt::print("refund total {}\n", money::formatMoney(currency, result->totalMinor, table));
    if (result->completesTransaction) {
        fmt::print("transaction {} is now fully refunded\n", transaction.id);
    }
    return 0;
}

//-------------------------------------------------------------------------

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"penny - monetary precision engine"};
    app.require_subcommand(1);

    fs::path configPath;
    app.add_option("-c,--config", configPath, "Engine config file")
        ->check(CLI::ExistingFile);

    CLI::App* allocateCmd = app.add_subcommand("allocate", "Split a minor-unit total by weights");
    std::vector<Weight> weights;
    allocateCmd->add_option("-w,--weights", weights, "Comma-separated non-negative weights")
        ->delimiter(',')
        ->required();
    MinorAmount total{};
    allocateCmd->add_option("-t,--total", total, "Total in minor units")->required();

    CLI::App* convertCmd = app.add_subcommand("convert", "Quantize an amount to minor units");
    std::string currency;
    convertCmd->add_option("--currency", currency, "ISO 4217 code (default from config)");
    std::string amount;
    convertCmd->add_option("--amount", amount, "Decimal amount")->required();

    CLI::App* taxCmd = app.add_subcommand("tax", "Per-line tax and order totals");
    fs::path taxOrder;
    taxCmd->add_option("-f,--order-file", taxOrder, "Order file")
        ->check(CLI::ExistingFile)
        ->required();

    CLI::App* refundCmd = app.add_subcommand("refund", "Validate and compute a refund");
    fs::path refundOrder;
    refundCmd->add_option("-f,--order-file", refundOrder, "Order file")
        ->check(CLI::ExistingFile)
        ->required();
    bool full{};
    refundCmd->add_flag("--full", full, "Refund every remaining unit");

    CLI11_PARSE(app, argc, argv);

    try {
        const auto engineConfig = configPath.empty()
            ? config::EngineConfig{}
            : config::EngineConfig::fromFile(configPath);
        logging::configure(engineConfig.logging);

        if (allocateCmd->parsed()) {
            return runAllocate(weights, total);
        }
        if (convertCmd->parsed()) {
            return runConvert(engineConfig, currency, amount);
        }
        if (taxCmd->parsed()) {
            return runTax(engineConfig, taxOrder);
        }
        return runRefund(engineConfig, refundOrder, full);
    }
    catch (const std::exception& e) {
        logging::logger().error("{}", e.what());
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}

//-------------------------------------------------------------------------
