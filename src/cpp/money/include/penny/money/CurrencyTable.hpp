/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace penny::money
{

//-------------------------------------------------------------------------

struct CurrencyExponent
{
    std::string_view code;
    uint32_t exponent;
};

inline constexpr uint32_t kDefaultExponent = 2;
inline constexpr uint32_t kMaxExponent = 4;

inline constexpr auto kBuiltinExponents = std::to_array<CurrencyExponent>({
    {"USD", 2}, {"EUR", 2}, {"GBP", 2}, {"CAD", 2},
    {"AUD", 2}, {"CHF", 2}, {"CNY", 2}, {"INR", 2},
    {"JPY", 0}, {"KRW", 0}, {"VND", 0}, {"CLP", 0},
    {"KWD", 3}, {"BHD", 3}, {"OMR", 3}, {"JOD", 3}, {"TND", 3}
});

//-------------------------------------------------------------------------

/**
 * Currency code -> number of decimal digits in one minor unit.
 *
 * The built-in entries are constant. A table built from configuration may add
 * codes; restating a built-in code with its own exponent is accepted, any
 * other exponent for it throws. Unknown codes get kDefaultExponent. Codes are
 * matched case-insensitively.
 */
class CurrencyTable
{
public:
    CurrencyTable() noexcept = default;
    explicit CurrencyTable(const std::map<std::string, uint32_t>& overrides);

    [[nodiscard]] uint32_t exponent(std::string_view currency) const;
    [[nodiscard]] bool isKnown(std::string_view currency) const;
    [[nodiscard]] decimal_t quantum(std::string_view currency) const;

    [[nodiscard]] const auto& overrides() const noexcept { return m_overrides; }

    [[nodiscard]] static const CurrencyTable& defaults() noexcept;
    [[nodiscard]] static CurrencyTable fromXML(pugi::xml_node node);

private:
    [[nodiscard]] std::optional<uint32_t> find(std::string_view currency) const;

    std::map<std::string, uint32_t, std::less<>> m_overrides;
};

//-------------------------------------------------------------------------

[[nodiscard]] std::string normalizeCurrencyCode(std::string_view currency);

[[nodiscard]] uint32_t validateExponent(
    uint32_t exponent, std::source_location sl = std::source_location::current());

// Built-in table only.
[[nodiscard]] uint32_t exponent(std::string_view currency);

//-------------------------------------------------------------------------

}  // namespace penny::money

//-------------------------------------------------------------------------
