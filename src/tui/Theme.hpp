// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string_view>

#include <tui/MarkdownRenderer.hpp>
#include <tui/TerminalOutput.hpp>

namespace tailview::tui
{

/// @brief Defines a color palette for the TUI theme.
struct ColorPalette
{
    RgbColor primary;   ///< Accent for names and focus.
    RgbColor secondary; ///< Accent for thinking and subagents.
    RgbColor surface;   ///< Status row and box background.
    RgbColor text;
    RgbColor textMuted;
    RgbColor success;
    RgbColor warning;
    RgbColor error;
    RgbColor info;
    RgbColor border;
};

/// @brief Complete set of styles used by transcript items and the viewer chrome.
struct Theme
{
    ColorPalette colors;

    Style textNormal;
    Style textMuted;

    // Message items
    Style assistantBorder;
    Style userBorder;
    Style userText;
    Style thinkingContent;
    Style thinkingHint;
    Style thinkingFooter;
    Style toolName;
    Style toolParams;
    Style toolOutput;
    Style toolError;
    Style toolTruncation;
    Style toolIconPending;
    Style toolIconSuccess;
    Style toolIconError;
    Style toolIconCanceled;
    Style subagentBorder;
    Style subagentHint;
    Style infoIcon;
    Style infoModel;
    Style infoProvider;
    Style infoDuration;
    Style iterationDivider;
    Style finishError;
    Style finishCanceled;

    // Assistant text
    MarkdownTheme markdown;

    // List and viewer chrome
    Style selectionMarker;
    Style statusBackground;
    Style statusKey;
    Style statusAction;
    Style statusWarning;
};

/// @brief Returns the default dark theme.
[[nodiscard]] auto darkTheme() -> Theme;

/// @brief Returns a light theme.
[[nodiscard]] auto lightTheme() -> Theme;

/// @brief Returns a theme without colors, only bold/dim/inverse attributes.
[[nodiscard]] auto monoTheme() -> Theme;

/// @brief Looks up a theme by name ("dark", "light", "mono").
[[nodiscard]] auto themeByName(std::string_view name) -> Result<Theme>;

/// @brief Global theme accessor.
///
/// Items read the current theme while laying out, so changing it requires
/// invalidating every item that has already rendered.
class ThemeManager
{
  public:
    [[nodiscard]] static auto instance() -> ThemeManager&;

    [[nodiscard]] auto current() const noexcept -> Theme const&;
    void setCurrent(Theme theme);
    void reset();

  private:
    ThemeManager();
    Theme _current;
};

/// @brief Convenience function to get the current theme.
[[nodiscard]] auto currentTheme() -> Theme const&;

} // namespace tailview::tui
