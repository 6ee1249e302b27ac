/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/allocation/Allocator.hpp"

#include <fmt/ranges.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <numeric>
#include <random>

//-------------------------------------------------------------------------

using namespace penny;
using namespace penny::allocation;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr auto kMaxMinor = std::numeric_limits<MinorAmount>::max();
constexpr auto kMinMinor = std::numeric_limits<MinorAmount>::min();

}  // namespace

//-------------------------------------------------------------------------

struct AllocateTestParams
{
    std::vector<Weight> weights;
    MinorAmount total;
    std::vector<MinorAmount> refShares;
};

void PrintTo(const AllocateTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.weights = [{}], .total = {}, .refShares = [{}]}}",
        fmt::join(params.weights, ", "),
        params.total,
        fmt::join(params.refShares, ", "));
}

struct AllocateTest : TestWithParam<AllocateTestParams> {};

TEST_P(AllocateTest, WorksCorrectly)
{
    const auto& [weights, total, refShares] = GetParam();
    EXPECT_THAT(allocate(weights, total), ElementsAreArray(refShares));
}

INSTANTIATE_TEST_SUITE_P(
    AllocatorTests,
    AllocateTest,
    Values(
        AllocateTestParams{{100, 100, 100}, 100, {34, 33, 33}},
        AllocateTestParams{{1000, 1500, 2000}, 100, {22, 33, 45}},
        AllocateTestParams{{1, 1, 1}, 2, {1, 1, 0}},
        AllocateTestParams{{0, 5, 0, 5}, 7, {0, 4, 0, 3}},
        AllocateTestParams{{1, 2, 3, 4}, 1000001, {100000, 200000, 300000, 400001}},
        AllocateTestParams{{3, 3, 3}, -10, {-4, -3, -3}},
        AllocateTestParams{{1000, 1500, 2000}, -100, {-22, -33, -45}},
        AllocateTestParams{{7}, 12345, {12345}},
        AllocateTestParams{{0, 0, 0}, 100, {0, 0, 0}},
        AllocateTestParams{{1, 2, 3}, 0, {0, 0, 0}},
        AllocateTestParams{{}, 100, {}},
        AllocateTestParams{
            {kMaxMinor, kMaxMinor, 1},
            kMaxMinor,
            {4611686018427387903, 4611686018427387903, 1}
        },
        AllocateTestParams{{kMaxMinor, 1}, kMinMinor, {-kMaxMinor, -1}}
    ));

//-------------------------------------------------------------------------

TEST(AllocatorTests, RejectsNegativeWeight)
{
    const std::vector<Weight> weights{10, -1, 5};
    EXPECT_THROW((void)allocate(weights, 100), std::invalid_argument);
}

TEST(AllocatorTests, IsDeterministic)
{
    const std::vector<Weight> weights{17, 0, 23, 23, 5, 91};
    EXPECT_EQ(allocate(weights, 1009), allocate(weights, 1009));
}

TEST(AllocatorTests, RemainderTiesFavourLowerIndex)
{
    const std::vector<Weight> weights{1, 1, 1, 1, 1};
    EXPECT_THAT(allocate(weights, 3), ElementsAre(1, 1, 1, 0, 0));
    EXPECT_THAT(allocate(weights, 8), ElementsAre(2, 2, 2, 1, 1));
}

//-------------------------------------------------------------------------

struct AllocateStressTest : TestWithParam<uint32_t> {};

TEST_P(AllocateStressTest, SumIsExactAndZeroWeightsGetZero)
{
    std::mt19937 rng{GetParam()};
    std::uniform_int_distribution<size_t> sizes{1, 12};
    std::uniform_int_distribution<Weight> weightDist{0, 1'000'000};
    std::uniform_int_distribution<MinorAmount> totalDist{-10'000'000, 10'000'000};
    std::bernoulli_distribution zeroWeight{0.2};

    for (int i = 0; i < 500; ++i) {
        std::vector<Weight> weights(sizes(rng));
        for (auto& w : weights) {
            w = zeroWeight(rng) ? 0 : weightDist(rng);
        }
        const MinorAmount total = totalDist(rng);

        const auto shares = allocate(weights, total);
        ASSERT_EQ(shares.size(), weights.size());

        const bool allZero = std::reduce(weights.begin(), weights.end(), Weight{}) == 0;
        const MinorAmount sum = std::reduce(shares.begin(), shares.end(), MinorAmount{});
        EXPECT_EQ(sum, allZero ? 0 : total);

        for (size_t j = 0; j < weights.size(); ++j) {
            if (weights[j] == 0) {
                EXPECT_EQ(shares[j], 0);
            }
        }
        EXPECT_EQ(shares, allocate(weights, total));
    }
}

TEST_P(AllocateStressTest, LargeMagnitudesStayExact)
{
    std::mt19937_64 rng{GetParam()};
    std::uniform_int_distribution<size_t> sizes{2, 8};
    std::uniform_int_distribution<Weight> weightDist{0, kMaxMinor};
    std::uniform_int_distribution<MinorAmount> totalDist{kMinMinor, kMaxMinor};

    for (int i = 0; i < 100; ++i) {
        std::vector<Weight> weights(sizes(rng));
        for (auto& w : weights) {
            w = weightDist(rng);
        }
        const MinorAmount total = totalDist(rng);

        const auto shares = allocate(weights, total);

        // Signed 64-bit addition could overflow on the way; compare in 128 bits.
        __int128 sum = 0;
        for (MinorAmount share : shares) {
            sum += share;
            EXPECT_TRUE(total >= 0 ? share >= 0 : share <= 0);
        }
        EXPECT_TRUE(sum == static_cast<__int128>(total));
    }
}

INSTANTIATE_TEST_SUITE_P(
    AllocatorTests,
    AllocateStressTest,
    Values(1u, 42u, 1337u, 20240611u, 4294967295u));

//-------------------------------------------------------------------------
