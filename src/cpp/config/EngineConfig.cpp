/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "penny/config/EngineConfig.hpp"

#include <cctype>

//-------------------------------------------------------------------------

namespace penny::config
{

//-------------------------------------------------------------------------

EngineConfig EngineConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node || std::string_view{node.name()} != "Penny") {
        throw std::invalid_argument{fmt::format(
            "{}: Expected a 'Penny' node, got '{}'", ctx, node.name())};
    }

    EngineConfig config;

    if (pugi::xml_attribute attr = node.attribute("defaultCurrency")) {
        const std::string_view code = attr.as_string();
        if (code.size() != 3 || !ranges::all_of(code, [](char c) {
                return std::isalpha(static_cast<unsigned char>(c)) != 0;
            })) {
            throw std::invalid_argument{fmt::format(
                "{}: Default currency must be a 3-letter code, was '{}'", ctx, code)};
        }
        config.defaultCurrency = money::normalizeCurrencyCode(code);
    }

    if (pugi::xml_node currenciesNode = node.child("Currencies")) {
        config.currencies = money::CurrencyTable::fromXML(currenciesNode);
    }

    if (pugi::xml_node loggingNode = node.child("Logging")) {
        config.logging = loggingConfigFromXML(loggingNode);
    }

    return config;
}

//-------------------------------------------------------------------------

EngineConfig EngineConfig::fromFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to load '{}': {} (offset {})",
            ctx, path.c_str(), result.description(), result.offset)};
    }
    return fromXML(doc.child("Penny"));
}

//-------------------------------------------------------------------------

logging::LoggingConfig loggingConfigFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    logging::LoggingConfig config;

    if (pugi::xml_attribute attr = node.attribute("level")) {
        const std::string level = attr.as_string();
        config.level = spdlog::level::from_str(level);
        // from_str maps anything unrecognised to off.
        if (config.level == spdlog::level::off && level != "off") {
            throw std::invalid_argument{fmt::format("{}: Unknown log level '{}'", ctx, level)};
        }
    }
    if (pugi::xml_attribute attr = node.attribute("file")) {
        config.file = fs::path{attr.as_string()};
    }
    if (pugi::xml_attribute attr = node.attribute("pattern")) {
        config.pattern = attr.as_string();
    }

    return config;
}

//-------------------------------------------------------------------------

}  // namespace penny::config

//-------------------------------------------------------------------------
