/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/decimal/decimal.hpp"
#include "formatting.hpp"

#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace penny;
using namespace penny::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct RoundHalfEvenTestParams
{
    decimal_t value;
    uint32_t decimalPlaces;
    decimal_t refValue;
};

void PrintTo(const RoundHalfEvenTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.value = {}, .decimalPlaces = {}, .refValue = {}}}",
        params.value,
        params.decimalPlaces,
        params.refValue);
}

struct RoundHalfEvenTest : TestWithParam<RoundHalfEvenTestParams> {};

TEST_P(RoundHalfEvenTest, WorksCorrectly)
{
    const auto [value, decimalPlaces, refValue] = GetParam();
    EXPECT_EQ(util::roundHalfEven(value, decimalPlaces), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    RoundHalfEvenTest,
    Values(
        RoundHalfEvenTestParams{
            .value = DEC(10.125), .decimalPlaces = 2, .refValue = DEC(10.12)
        },
        RoundHalfEvenTestParams{
            .value = DEC(10.135), .decimalPlaces = 2, .refValue = DEC(10.14)
        },
        RoundHalfEvenTestParams{
            .value = DEC(10.1251), .decimalPlaces = 2, .refValue = DEC(10.13)
        },
        RoundHalfEvenTestParams{
            .value = DEC(-10.125), .decimalPlaces = 2, .refValue = DEC(-10.12)
        },
        RoundHalfEvenTestParams{
            .value = DEC(-10.135), .decimalPlaces = 2, .refValue = DEC(-10.14)
        },
        RoundHalfEvenTestParams{
            .value = DEC(2.5), .decimalPlaces = 0, .refValue = DEC(2.0)
        },
        RoundHalfEvenTestParams{
            .value = DEC(3.5), .decimalPlaces = 0, .refValue = DEC(4.0)
        },
        RoundHalfEvenTestParams{
            .value = DEC(1234.56), .decimalPlaces = 0, .refValue = DEC(1235.0)
        },
        RoundHalfEvenTestParams{
            .value = DEC(10.1234), .decimalPlaces = 3, .refValue = DEC(10.123)
        },
        RoundHalfEvenTestParams{
            .value = DEC(0.0), .decimalPlaces = 4, .refValue = DEC(0.0)
        },
        RoundHalfEvenTestParams{
            .value = DEC(0.005), .decimalPlaces = 2, .refValue = DEC(0.00)
        },
        RoundHalfEvenTestParams{
            .value = DEC(0.015), .decimalPlaces = 2, .refValue = DEC(0.02)
        }
    ));

//-------------------------------------------------------------------------

TEST(DecimalTests, ParseRejectsMalformedText)
{
    EXPECT_EQ(util::parseDecimal("12.50"), std::optional{DEC(12.50)});
    EXPECT_EQ(util::parseDecimal(""), std::nullopt);
    EXPECT_EQ(util::parseDecimal("twelve"), std::nullopt);
    EXPECT_EQ(util::parseDecimal("inf"), std::nullopt);
    EXPECT_EQ(util::parseDecimal("nan"), std::nullopt);
    EXPECT_THROW((void)util::decimalFromString("abc"), std::invalid_argument);
}

TEST(DecimalTests, ParseKeepsUpToFullPrecision)
{
    EXPECT_EQ(
        util::parseDecimal("10.12500000000000001"),
        std::optional{DEC(10.12500000000000001)});
    EXPECT_EQ(
        util::parseDecimal("1234567890123456789012345678901234"),
        std::optional{decimal_t{1234567890123456789LL} * util::pow10(15)
                      + decimal_t{12345678901234LL}});
    EXPECT_EQ(
        util::parseDecimal("12345678901234567890123456789012345"), std::nullopt);
    EXPECT_EQ(
        util::parseDecimal("0.00000000000000000000000000000000000000001"),
        std::optional{DEC(1e-41)});
    EXPECT_EQ(
        util::parseDecimal("2.50000000000000000000000000000000000000000"),
        std::optional{DEC(2.5)});
}

TEST(DecimalTests, DoubleGoesThroughShortestText)
{
    EXPECT_EQ(util::decimalFromDouble(0.1), DEC(0.1));
    EXPECT_EQ(util::decimalFromDouble(10.125), DEC(10.125));
    EXPECT_THROW(
        (void)util::decimalFromDouble(std::numeric_limits<double>::quiet_NaN()),
        std::invalid_argument);
    EXPECT_THROW(
        (void)util::decimalFromDouble(std::numeric_limits<double>::infinity()),
        std::invalid_argument);
}

TEST(DecimalTests, ToInt64)
{
    EXPECT_EQ(util::toInt64(DEC(1013.0)), std::optional<int64_t>{1013});
    EXPECT_EQ(util::toInt64(DEC(-1050.00)), std::optional<int64_t>{-1050});
    EXPECT_EQ(util::toInt64(DEC(0.0)), std::optional<int64_t>{0});
    EXPECT_EQ(util::toInt64(DEC(1.5e3)), std::optional<int64_t>{1500});
    EXPECT_EQ(util::toInt64(DEC(10.5)), std::nullopt);
    EXPECT_EQ(util::toInt64(DEC(1e19)), std::nullopt);
    EXPECT_EQ(
        util::toInt64(decimal_t{std::numeric_limits<long long>::max()}),
        std::optional<int64_t>{std::numeric_limits<int64_t>::max()});
}

TEST(DecimalTests, ToDecimalAcceptsNumbersAndText)
{
    EXPECT_EQ(util::toDecimal(42), 42_dec);
    EXPECT_EQ(util::toDecimal("10.127"), DEC(10.127));
    EXPECT_EQ(util::toDecimal(std::string{"-3.5"}), DEC(-3.5));
    EXPECT_EQ(util::toDecimal(2.25), DEC(2.25));
}

//-------------------------------------------------------------------------
