// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace tailview
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/tailview";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/tailview";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    if (auto const* view = json::find(root, "view"))
    {
        config.view.itemGap = std::max(json::getIntOr(*view, "itemGap", defaults.view.itemGap), 0);
        config.view.autoScroll = json::getBoolOr(*view, "autoScroll", defaults.view.autoScroll);
        config.view.wheelStep = std::max(json::getIntOr(*view, "wheelStep", defaults.view.wheelStep), 1);
        config.view.theme = json::getStringOr(*view, "theme", defaults.view.theme);
        config.view.selectionMarker = json::getStringOr(*view, "selectionMarker", defaults.view.selectionMarker);
    }

    if (auto const* reader = json::find(root, "reader"))
    {
        config.reader.follow = json::getBoolOr(*reader, "follow", defaults.reader.follow);
        config.reader.replayDelayMs =
            std::max(json::getIntOr(*reader, "replayDelayMs", defaults.reader.replayDelayMs), 0);
        config.reader.sessionsDir = json::getStringOr(*reader, "sessionsDir", "");
    }

    if (auto const* logSection = json::find(root, "log"))
    {
        config.log.level = json::getStringOr(*logSection, "level", defaults.log.level);
        config.log.file = json::getStringOr(*logSection, "file", "");
        if (auto level = log::parseLevel(config.log.level); !level)
            return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, level.error().message));
    }

    return config;
}

auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto view = nlohmann::json::object();
    view["itemGap"] = config.view.itemGap;
    view["autoScroll"] = config.view.autoScroll;
    view["wheelStep"] = config.view.wheelStep;
    view["theme"] = config.view.theme;
    view["selectionMarker"] = config.view.selectionMarker;
    root["view"] = std::move(view);

    auto reader = nlohmann::json::object();
    reader["follow"] = config.reader.follow;
    reader["replayDelayMs"] = config.reader.replayDelayMs;
    if (!config.reader.sessionsDir.empty())
        reader["sessionsDir"] = config.reader.sessionsDir;
    root["reader"] = std::move(reader);

    auto logSection = nlohmann::json::object();
    logSection["level"] = config.log.level;
    if (!config.log.file.empty())
        logSection["file"] = config.log.file;
    root["log"] = std::move(logSection);

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace tailview
