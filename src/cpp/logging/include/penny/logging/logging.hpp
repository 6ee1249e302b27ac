/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace penny::logging
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLoggerName = "penny";
inline constexpr std::string_view kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

struct LoggingConfig
{
    spdlog::level::level_enum level{spdlog::level::warn};
    std::optional<std::filesystem::path> file;
    std::string pattern{kDefaultPattern};
};

// Engine-wide logger; stderr at warn until configure() is called.
[[nodiscard]] spdlog::logger& logger() noexcept;

// Not thread-safe with respect to concurrent logging; call during start-up.
void configure(const LoggingConfig& config);

//-------------------------------------------------------------------------

}  // namespace penny::logging

//-------------------------------------------------------------------------
