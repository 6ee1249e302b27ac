/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/logging/logging.hpp"
#include "penny/money/CurrencyTable.hpp"

//-------------------------------------------------------------------------

namespace penny::config
{

//-------------------------------------------------------------------------

struct EngineConfig
{
    std::string defaultCurrency{"USD"};
    money::CurrencyTable currencies;
    logging::LoggingConfig logging;

    [[nodiscard]] static EngineConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static EngineConfig fromFile(const fs::path& path);
};

[[nodiscard]] logging::LoggingConfig loggingConfigFromXML(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace penny::config

//-------------------------------------------------------------------------
