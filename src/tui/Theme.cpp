// SPDX-License-Identifier: Apache-2.0
#include <tui/Theme.hpp>

#include <format>

namespace tailview::tui
{

namespace
{
    auto fg(RgbColor color, bool bold = false) -> Style
    {
        auto style = Style {};
        style.fg = color;
        style.bold = bold;
        return style;
    }

    /// Derives all item styles from a palette; dark and light differ only in colors.
    auto themeFromPalette(ColorPalette const& colors) -> Theme
    {
        auto theme = Theme {};
        theme.colors = colors;

        theme.textNormal = fg(colors.text);
        theme.textMuted = fg(colors.textMuted);

        theme.assistantBorder = fg(colors.primary);
        theme.userBorder = fg(colors.secondary);
        theme.userText = fg(colors.text);
        theme.thinkingContent = fg(colors.textMuted);
        theme.thinkingContent.italic = true;
        theme.thinkingHint = fg(colors.textMuted);
        theme.thinkingHint.dim = true;
        theme.thinkingFooter = fg(colors.secondary);

        theme.toolName = fg(colors.text, true);
        theme.toolParams = fg(colors.textMuted);
        theme.toolOutput = fg(colors.text);
        theme.toolOutput.bg = colors.surface;
        theme.toolError = fg(colors.error);
        theme.toolError.bg = colors.surface;
        theme.toolTruncation = fg(colors.textMuted);
        theme.toolTruncation.bg = colors.surface;
        theme.toolIconPending = fg(colors.warning);
        theme.toolIconSuccess = fg(colors.success);
        theme.toolIconError = fg(colors.error);
        theme.toolIconCanceled = fg(colors.textMuted);

        theme.subagentBorder = fg(colors.border);
        theme.subagentHint = fg(colors.info);
        theme.infoIcon = fg(colors.primary);
        theme.infoModel = fg(colors.text, true);
        theme.infoProvider = fg(colors.textMuted);
        theme.infoDuration = fg(colors.textMuted);
        theme.iterationDivider = fg(colors.border);
        theme.finishError = fg(colors.error, true);
        theme.finishCanceled = fg(colors.warning);

        theme.markdown.text = fg(colors.text);
        theme.markdown.heading1 = fg(colors.primary, true);
        theme.markdown.heading2 = fg(colors.primary, true);
        theme.markdown.heading2.underline = true;
        theme.markdown.heading3 = fg(colors.text, true);
        theme.markdown.codeBlock = fg(colors.info);
        theme.markdown.codeInline = fg(colors.info);
        theme.markdown.bold = fg(colors.text, true);
        theme.markdown.italic = fg(colors.text);
        theme.markdown.italic.italic = true;
        theme.markdown.link = fg(colors.primary);
        theme.markdown.link.underline = true;
        theme.markdown.listMarker = fg(colors.success);
        theme.markdown.blockquote = fg(colors.textMuted);
        theme.markdown.blockquote.italic = true;
        theme.markdown.rule = fg(colors.border);

        theme.selectionMarker = fg(colors.primary, true);
        theme.statusBackground = fg(colors.text);
        theme.statusBackground.bg = colors.surface;
        theme.statusKey = fg(colors.primary, true);
        theme.statusKey.bg = colors.surface;
        theme.statusAction = fg(colors.textMuted);
        theme.statusAction.bg = colors.surface;
        theme.statusWarning = fg(colors.warning);
        theme.statusWarning.bg = colors.surface;
        return theme;
    }
} // namespace

auto darkTheme() -> Theme
{
    return themeFromPalette(ColorPalette {
        .primary = RgbColor { .r = 130, .g = 180, .b = 255 },   // Light blue
        .secondary = RgbColor { .r = 180, .g = 130, .b = 255 }, // Light purple
        .surface = RgbColor { .r = 40, .g = 42, .b = 54 },
        .text = RgbColor { .r = 248, .g = 248, .b = 242 },
        .textMuted = RgbColor { .r = 140, .g = 140, .b = 150 },
        .success = RgbColor { .r = 80, .g = 250, .b = 123 },
        .warning = RgbColor { .r = 255, .g = 184, .b = 108 },
        .error = RgbColor { .r = 255, .g = 85, .b = 85 },
        .info = RgbColor { .r = 139, .g = 233, .b = 253 },
        .border = RgbColor { .r = 68, .g = 71, .b = 90 },
    });
}

auto lightTheme() -> Theme
{
    return themeFromPalette(ColorPalette {
        .primary = RgbColor { .r = 0, .g = 100, .b = 200 },
        .secondary = RgbColor { .r = 100, .g = 0, .b = 180 },
        .surface = RgbColor { .r = 240, .g = 240, .b = 245 },
        .text = RgbColor { .r = 40, .g = 42, .b = 54 },
        .textMuted = RgbColor { .r = 120, .g = 120, .b = 130 },
        .success = RgbColor { .r = 0, .g = 150, .b = 80 },
        .warning = RgbColor { .r = 200, .g = 130, .b = 0 },
        .error = RgbColor { .r = 200, .g = 50, .b = 50 },
        .info = RgbColor { .r = 0, .g = 130, .b = 180 },
        .border = RgbColor { .r = 200, .g = 200, .b = 210 },
    });
}

auto monoTheme() -> Theme
{
    auto theme = Theme {};
    theme.thinkingContent.italic = true;
    theme.thinkingHint.dim = true;
    theme.textMuted.dim = true;
    theme.toolName.bold = true;
    theme.toolParams.dim = true;
    theme.toolError.bold = true;
    theme.toolTruncation.dim = true;
    theme.infoModel.bold = true;
    theme.infoProvider.dim = true;
    theme.finishError.bold = true;
    theme.markdown.heading1.bold = true;
    theme.markdown.heading2.bold = true;
    theme.markdown.heading2.underline = true;
    theme.markdown.heading3.bold = true;
    theme.markdown.codeBlock.dim = true;
    theme.markdown.codeInline.dim = true;
    theme.markdown.bold.bold = true;
    theme.markdown.italic.italic = true;
    theme.markdown.link.underline = true;
    theme.markdown.blockquote.italic = true;
    theme.markdown.blockquote.dim = true;
    theme.markdown.rule.dim = true;
    theme.selectionMarker.bold = true;
    theme.statusBackground.inverse = true;
    theme.statusKey.inverse = true;
    theme.statusKey.bold = true;
    theme.statusAction.inverse = true;
    theme.statusWarning.inverse = true;
    theme.statusWarning.bold = true;
    return theme;
}

auto themeByName(std::string_view name) -> Result<Theme>
{
    if (name == "dark")
        return darkTheme();
    if (name == "light")
        return lightTheme();
    if (name == "mono")
        return monoTheme();
    return makeError(ErrorCode::InvalidArgument, std::format("Unknown theme: {}", name));
}

// --- ThemeManager ---

ThemeManager::ThemeManager(): _current(darkTheme())
{
}

auto ThemeManager::instance() -> ThemeManager&
{
    static auto manager = ThemeManager();
    return manager;
}

auto ThemeManager::current() const noexcept -> Theme const&
{
    return _current;
}

void ThemeManager::setCurrent(Theme theme)
{
    _current = std::move(theme);
}

void ThemeManager::reset()
{
    _current = darkTheme();
}

auto currentTheme() -> Theme const&
{
    return ThemeManager::instance().current();
}

} // namespace tailview::tui
