// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace tailview
{

/// @brief Transcript view configuration section.
struct ViewConfig
{
    int itemGap = 1;
    bool autoScroll = true;
    int wheelStep = 3;
    std::string theme = "dark";
    std::string selectionMarker = "▸ ";
};

/// @brief Event input configuration section.
struct ReaderConfig
{
    bool follow = false;
    int replayDelayMs = 0;

    /// @brief Directory holding subagent session logs (<sessionId>.jsonl).
    /// Empty means the directory of the main event file.
    std::string sessionsDir;
};

/// @brief Logging configuration section.
struct LogConfig
{
    std::string level = "info";
    std::string file; ///< Appended to while the terminal UI is active; empty disables.
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ViewConfig view;
    ReaderConfig reader;
    LogConfig log;
};

/// @brief Loads the configuration from the default config path; a missing file yields defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating parent directories.
[[nodiscard]] auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/tailview, else ~/.config/tailview, else ".".
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace tailview
