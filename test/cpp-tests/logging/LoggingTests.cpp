/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/allocation/validation.hpp"
#include "penny/logging/logging.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

//-------------------------------------------------------------------------

using namespace penny;

using namespace testing;

//-------------------------------------------------------------------------

struct LoggingTest : Test
{
    void SetUp() override
    {
        logPath = std::filesystem::temp_directory_path()
            / fmt::format("penny-logging-{}.log", UnitTest::GetInstance()->random_seed());
        std::filesystem::remove(logPath);
    }

    void TearDown() override
    {
        logging::configure(logging::LoggingConfig{});
        std::filesystem::remove(logPath);
    }

    std::string readLog() const
    {
        std::ifstream in{logPath};
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path logPath;
};

TEST_F(LoggingTest, DefaultsToWarn)
{
    EXPECT_EQ(logging::logger().name(), logging::kLoggerName);
    EXPECT_EQ(logging::logger().level(), spdlog::level::warn);
}

TEST_F(LoggingTest, SumMismatchIsLoggedAtCritical)
{
    logging::configure(logging::LoggingConfig{
        .level = spdlog::level::info, .file = logPath, .pattern = "%l %v"});

    const std::vector<MinorAmount> components{1, 1};
    EXPECT_THROW(allocation::enforceSum(components, 3, "split"), allocation::SumMismatchError);
    logging::logger().info("after");
    logging::logger().debug("hidden");
    logging::logger().flush();

    const auto text = readLog();
    EXPECT_THAT(
        text,
        HasSubstr("critical Minor unit sum mismatch split: expected 3, got 2 (diff: -1)"));
    EXPECT_THAT(text, HasSubstr("info after"));
    EXPECT_THAT(text, Not(HasSubstr("hidden")));
}

//-------------------------------------------------------------------------
