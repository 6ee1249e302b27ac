/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/money/proportion.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace penny;
using namespace penny::money;

//-------------------------------------------------------------------------

TEST(ProportionTests, Percentage)
{
    EXPECT_EQ(calculatePercentage("USD", DEC(100.00), DEC(8.5)), 850);
    EXPECT_EQ(calculatePercentage("USD", DEC(15.99), DEC(10)), 160);
    EXPECT_EQ(calculatePercentage("JPY", DEC(1999), DEC(8)), 160);
    EXPECT_EQ(calculatePercentage("KWD", DEC(12.345), DEC(0)), 0);
}

TEST(ProportionTests, Proportion)
{
    EXPECT_EQ(calculateProportion("USD", DEC(62.68), DEC(15.99), DEC(5.00)), 128);
    EXPECT_EQ(calculateProportion("USD", DEC(100), DEC(50), DEC(3.00)), 150);
    EXPECT_EQ(calculateProportion("USD", DEC(3), DEC(1), DEC(0.10)), 3);
}

TEST(ProportionTests, ZeroTotalYieldsZero)
{
    EXPECT_EQ(calculateProportion("USD", DEC(0), DEC(15.99), DEC(5.00)), 0);
}

//-------------------------------------------------------------------------
