/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/logging/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <memory>

//-------------------------------------------------------------------------

namespace penny::logging
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::shared_ptr<spdlog::logger> makeLogger()
{
    auto logger = std::make_shared<spdlog::logger>(
        std::string{kLoggerName}, std::make_shared<spdlog::sinks::stderr_sink_mt>());
    logger->set_level(spdlog::level::warn);
    logger->set_pattern(std::string{kDefaultPattern});
    logger->flush_on(spdlog::level::warn);
    return logger;
}

[[nodiscard]] const std::shared_ptr<spdlog::logger>& instance()
{
    static const std::shared_ptr<spdlog::logger> s_logger = makeLogger();
    return s_logger;
}

}  // namespace

//-------------------------------------------------------------------------

spdlog::logger& logger() noexcept
{
    return *instance();
}

//-------------------------------------------------------------------------

void configure(const LoggingConfig& config)
{
    const auto& log = instance();
    log->sinks().clear();
    if (config.file) {
        log->sinks().push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string()));
    }
    else {
        log->sinks().push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }
    log->set_level(config.level);
    log->set_pattern(config.pattern);
    log->debug("Logging configured at level {}", spdlog::level::to_string_view(config.level));
}

//-------------------------------------------------------------------------

}  // namespace penny::logging

//-------------------------------------------------------------------------
