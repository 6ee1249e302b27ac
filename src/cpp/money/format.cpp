/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/format.hpp"

#include <array>
#include <cctype>

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

namespace
{

struct CurrencySymbol
{
    std::string_view code;
    std::string_view symbol;
};

constexpr auto kSymbols = std::to_array<CurrencySymbol>({
    {"USD", "$"},
    {"EUR", "€"},
    {"GBP", "£"},
    {"JPY", "¥"},
    {"CNY", "¥"},
    {"INR", "₹"},
    {"KRW", "₩"}
});

[[nodiscard]] std::string groupThousands(uint64_t value)
{
    std::string digits = fmt::format("{}", value);
    for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<size_t>(pos), 1, ',');
    }
    return digits;
}

}  // namespace

//-------------------------------------------------------------------------

std::string_view currencySymbol(std::string_view currency) noexcept
{
    auto it = ranges::find_if(kSymbols, [currency](const CurrencySymbol& entry) {
        return ranges::equal(entry.code, currency, [](char lhs, char rhs) {
            return std::toupper(static_cast<unsigned char>(lhs))
                == std::toupper(static_cast<unsigned char>(rhs));
        });
    });
    return it != kSymbols.end() ? it->symbol : std::string_view{};
}

//-------------------------------------------------------------------------

std::string formatMoney(std::string_view currency, MinorAmount minor, const CurrencyTable& table)
{
    const uint32_t exponent = table.exponent(currency);

    uint64_t scale = 1;
    for (uint32_t i = 0; i < exponent; ++i) {
        scale *= 10;
    }

    // Negating INT64_MIN directly would overflow.
    const uint64_t magnitude = minor < 0
        ? static_cast<uint64_t>(-(minor + 1)) + 1
        : static_cast<uint64_t>(minor);

    const std::string_view symbol = currencySymbol(currency);
    const std::string prefix = symbol.empty()
        ? fmt::format("{} ", normalizeCurrencyCode(currency))
        : std::string{symbol};

    const std::string integral = groupThousands(magnitude / scale);
    if (exponent == 0) {
        return fmt::format("{}{}{}", minor < 0 ? "-" : "", prefix, integral);
    }
    return fmt::format(
        "{}{}{}.{:0{}}",
        minor < 0 ? "-" : "",
        prefix,
        integral,
        magnitude % scale,
        exponent);
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
