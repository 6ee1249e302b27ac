/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/allocation/validation.hpp"

#include "penny/logging/logging.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

//-------------------------------------------------------------------------

namespace penny::allocation
{

//-------------------------------------------------------------------------

namespace
{

using wide_t = boost::multiprecision::int128_t;

[[nodiscard]] MinorAmount saturate(const wide_t& val) noexcept
{
    const wide_t lo{std::numeric_limits<MinorAmount>::min()};
    const wide_t hi{std::numeric_limits<MinorAmount>::max()};
    return (val < lo ? lo : (val > hi ? hi : val)).convert_to<MinorAmount>();
}

}  // namespace

//-------------------------------------------------------------------------

MinorAmount SumMismatch::difference() const noexcept
{
    return saturate(wide_t{actual} - wide_t{expected});
}

//-------------------------------------------------------------------------

std::string SumMismatch::message() const
{
    const wide_t diff = wide_t{actual} - wide_t{expected};
    return fmt::format(
        "Minor unit sum mismatch{}{}: expected {}, got {} (diff: {}{})",
        context.empty() ? "" : " ",
        context,
        expected,
        actual,
        diff < 0 ? "" : "+",
        diff.str());
}

//-------------------------------------------------------------------------

SumMismatchError::SumMismatchError(SumMismatch mismatch)
    : std::logic_error{mismatch.message()},
      m_mismatch{std::move(mismatch)}
{}

//-------------------------------------------------------------------------

std::expected<void, SumMismatch> validateSum(
    std::span<const MinorAmount> components,
    MinorAmount expected,
    MinorAmount tolerance,
    std::string_view context)
{
    wide_t actual{0};
    for (MinorAmount component : components) {
        actual += component;
    }

    wide_t diff = actual - wide_t{expected};
    if (diff < 0) {
        diff = -diff;
    }
    if (diff <= wide_t{tolerance}) {
        return {};
    }

    // A sum that overflowed 64 bits is reported saturated.
    return std::unexpected{SumMismatch{
        .expected = expected,
        .actual = saturate(actual),
        .tolerance = tolerance,
        .context = std::string{context}
    }};
}

//-------------------------------------------------------------------------

void enforceSum(
    std::span<const MinorAmount> components,
    MinorAmount expected,
    std::string_view context)
{
    if (auto res = validateSum(components, expected, 0, context); !res) {
        logging::logger().critical("{}", res.error().message());
        throw SumMismatchError{std::move(res.error())};
    }
}

//-------------------------------------------------------------------------

}  // namespace penny::allocation

//-------------------------------------------------------------------------
