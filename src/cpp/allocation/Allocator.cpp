/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/allocation/Allocator.hpp"

#include <boost/multiprecision/cpp_int.hpp>

//-------------------------------------------------------------------------

namespace penny::allocation
{

//-------------------------------------------------------------------------

namespace
{

using wide_t = boost::multiprecision::int128_t;

}  // namespace

//-------------------------------------------------------------------------

std::vector<MinorAmount> allocate(std::span<const Weight> weights, MinorAmount total)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (auto it = ranges::find_if(weights, [](Weight w) { return w < 0; }); it != weights.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: Weights must be non-negative, weight #{} was {}",
            ctx, ranges::distance(weights.begin(), it), *it)};
    }

    std::vector<MinorAmount> result(weights.size(), 0);

    wide_t totalWeight{0};
    for (Weight w : weights) {
        totalWeight += w;
    }
    if (totalWeight == 0 || total == 0) {
        return result;
    }

    const bool negative = total < 0;
    const wide_t magnitude = negative ? wide_t{-wide_t{total}} : wide_t{total};

    std::vector<wide_t> shares(weights.size());
    std::vector<wide_t> residuals(weights.size());
    wide_t assigned{0};
    for (size_t i = 0; i < weights.size(); ++i) {
        const wide_t product = wide_t{weights[i]} * magnitude;
        shares[i] = product / totalWeight;
        residuals[i] = product % totalWeight;
        assigned += shares[i];
    }

    // Sum of the fractional residuals; always < weights.size().
    const auto remainder = static_cast<size_t>(wide_t{magnitude - assigned}.convert_to<uint64_t>());

    auto order = views::iota(size_t{0}, weights.size()) | ranges::to<std::vector>();
    ranges::partial_sort(
        order,
        order.begin() + static_cast<std::ptrdiff_t>(remainder),
        [&residuals](size_t lhs, size_t rhs) {
            if (residuals[lhs] != residuals[rhs]) {
                return residuals[lhs] > residuals[rhs];
            }
            return lhs < rhs;
        });
    for (size_t idx : order | views::take(remainder)) {
        shares[idx] += 1;
    }

    for (size_t i = 0; i < shares.size(); ++i) {
        const wide_t signedShare = negative ? wide_t{-shares[i]} : shares[i];
        result[i] = signedShare.convert_to<MinorAmount>();
    }
    return result;
}

//-------------------------------------------------------------------------

}  // namespace penny::allocation

//-------------------------------------------------------------------------
