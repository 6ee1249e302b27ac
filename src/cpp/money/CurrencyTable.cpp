/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/CurrencyTable.hpp"

#include <cctype>

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

CurrencyTable::CurrencyTable(const std::map<std::string, uint32_t>& overrides)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    for (const auto& [code, exponent] : overrides) {
        auto normalized = normalizeCurrencyCode(code);
        auto builtin = ranges::find(
            kBuiltinExponents, std::string_view{normalized}, &CurrencyExponent::code);
        if (builtin != kBuiltinExponents.end()) {
            if (builtin->exponent != exponent) {
                throw std::invalid_argument{fmt::format(
                    "{}: exponent of built-in currency {} is {}, cannot be set to {}",
                    ctx, normalized, builtin->exponent, exponent)};
            }
            continue;
        }
        m_overrides.insert_or_assign(std::move(normalized), validateExponent(exponent));
    }
}

//-------------------------------------------------------------------------

uint32_t CurrencyTable::exponent(std::string_view currency) const
{
    return find(currency).value_or(kDefaultExponent);
}

//-------------------------------------------------------------------------

bool CurrencyTable::isKnown(std::string_view currency) const
{
    return find(currency).has_value();
}

//-------------------------------------------------------------------------

decimal_t CurrencyTable::quantum(std::string_view currency) const
{
    return util::pow10(-static_cast<int32_t>(exponent(currency)));
}

//-------------------------------------------------------------------------

const CurrencyTable& CurrencyTable::defaults() noexcept
{
    static const CurrencyTable s_defaults;
    return s_defaults;
}

//-------------------------------------------------------------------------

CurrencyTable CurrencyTable::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::map<std::string, uint32_t> overrides;
    for (pugi::xml_node currencyNode : node.children("Currency")) {
        const std::string_view code = currencyNode.attribute("code").as_string();
        if (code.size() != 3) {
            throw std::invalid_argument{fmt::format(
                "{}: Currency code must have 3 letters, was '{}'", ctx, code)};
        }
        pugi::xml_attribute exponentAttr = currencyNode.attribute("exponent");
        if (!exponentAttr) {
            throw std::invalid_argument{fmt::format(
                "{}: Missing required argument 'exponent' for currency {}", ctx, code)};
        }
        overrides[std::string{code}] = exponentAttr.as_uint();
    }
    return CurrencyTable{overrides};
}

//-------------------------------------------------------------------------

std::optional<uint32_t> CurrencyTable::find(std::string_view currency) const
{
    const auto code = normalizeCurrencyCode(currency);
    if (auto it = m_overrides.find(code); it != m_overrides.end()) {
        return it->second;
    }
    auto it = ranges::find(kBuiltinExponents, std::string_view{code}, &CurrencyExponent::code);
    if (it != kBuiltinExponents.end()) {
        return it->exponent;
    }
    return {};
}

//-------------------------------------------------------------------------

std::string normalizeCurrencyCode(std::string_view currency)
{
    return currency
        | views::transform([](char c) {
            return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        })
        | ranges::to<std::string>();
}

//-------------------------------------------------------------------------

uint32_t validateExponent(uint32_t exponent, std::source_location sl)
{
    if (exponent > kMaxExponent) {
        throw std::invalid_argument{fmt::format(
            "{}: currency exponent should be <= {}, was {}",
            sl.function_name(), kMaxExponent, exponent)};
    }
    return exponent;
}

//-------------------------------------------------------------------------

uint32_t exponent(std::string_view currency)
{
    return CurrencyTable::defaults().exponent(currency);
}

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
