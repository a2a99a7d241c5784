// SPDX-License-Identifier: Apache-2.0
#include <tui/MarkdownRenderer.hpp>
#include <tui/MessageItems.hpp>
#include <tui/Theme.hpp>

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace tailview::tui
{

namespace
{
    constexpr auto MaxTextWidth = 120;
    constexpr auto Rule = std::string_view { "─" };

    /// Content width for bordered text: two columns go to the border.
    auto borderedWidth(int width) noexcept -> int
    {
        return std::clamp(width - 2, 1, MaxTextWidth);
    }

    auto capitalized(std::string text) -> std::string
    {
        if (!text.empty() && text[0] >= 'a' && text[0] <= 'z')
            text[0] = static_cast<char>(text[0] - 'a' + 'A');
        return text;
    }

    struct StatusIcon
    {
        std::string_view glyph;
        Style style;
    };

    auto statusIcon(ToolStatus status) -> StatusIcon
    {
        auto const& theme = currentTheme();
        switch (status)
        {
            case ToolStatus::Pending:
            case ToolStatus::Running: return { "●", theme.toolIconPending };
            case ToolStatus::Success: return { "✓", theme.toolIconSuccess };
            case ToolStatus::Error: return { "×", theme.toolIconError };
            case ToolStatus::Canceled: return { "×", theme.toolIconCanceled };
        }
        return { "●", theme.toolIconPending };
    }

    /// Tool and hook output: a blank row, then the output in a shaded block, cut to
    /// MaxOutputLines with an expand hint unless expanded or failed.
    void appendOutputBlock(std::vector<TextLine>& lines, std::string const& output, int width, bool isError,
                           bool expanded)
    {
        if (output.empty())
            return;

        auto const& theme = currentTheme();
        auto const outputWidth = std::max(width - 2, 1);
        auto const outputLines = splitLines(output);
        auto const showAll = isError || expanded || std::ssize(outputLines) <= ToolItem::MaxOutputLines;
        auto const visible = showAll ? std::ssize(outputLines) : ToolItem::MaxOutputLines;
        auto const& bodyStyle = isError ? theme.toolError : theme.toolOutput;

        lines.emplace_back();
        for (auto i = 0; i < visible; ++i)
        {
            auto line = TextLine::plain("  ");
            line.append(padRight(takeColumns(outputLines[static_cast<std::size_t>(i)], outputWidth), outputWidth),
                        bodyStyle);
            lines.push_back(std::move(line));
        }

        if (!showAll)
        {
            auto const hint = std::format("…({} more lines, click to expand)", std::ssize(outputLines) - visible);
            auto line = TextLine::plain("  ");
            line.append(padRight(takeColumns(hint, outputWidth), outputWidth), theme.toolTruncation);
            lines.push_back(std::move(line));
        }
    }

    auto subagentStatusText(ToolStatus status) -> std::string_view
    {
        switch (status)
        {
            case ToolStatus::Pending: return "Pending";
            case ToolStatus::Running: return "Running...";
            case ToolStatus::Success: return "Completed";
            case ToolStatus::Error: return "Error";
            case ToolStatus::Canceled: return "Canceled";
        }
        return "Unknown";
    }
} // namespace

// =============================================================================
// Free functions
// =============================================================================

auto toolStatusFromString(std::string_view status) noexcept -> ToolStatus
{
    if (status == "in_progress")
        return ToolStatus::Running;
    if (status == "completed")
        return ToolStatus::Success;
    if (status == "error")
        return ToolStatus::Error;
    if (status == "canceled" || status == "cancelled")
        return ToolStatus::Canceled;
    return ToolStatus::Pending;
}

auto formatDuration(std::chrono::milliseconds duration) -> std::string
{
    auto const ms = std::max<std::int64_t>(duration.count(), 0);
    if (ms < 1000)
        return std::format("{}ms", ms);

    auto const tenths = (ms + 50) / 100;
    if (tenths < 600)
        return tenths % 10 == 0 ? std::format("{}s", tenths / 10) : std::format("{}.{}s", tenths / 10, tenths % 10);

    auto const seconds = (ms + 500) / 1000;
    auto const h = seconds / 3600;
    auto const m = (seconds % 3600) / 60;
    auto const s = seconds % 60;
    if (h > 0)
        return std::format("{}h{}m{}s", h, m, s);
    return std::format("{}m{}s", m, s);
}

auto formatToolParams(nlohmann::json const& input, int maxWidth) -> std::string
{
    if (!input.is_object() || input.empty())
        return {};

    auto primaryKey = std::string_view {};
    if (input.contains("command"))
        primaryKey = "command";
    else if (input.contains("filePath"))
        primaryKey = "filePath";

    auto result = std::string {};
    if (!primaryKey.empty())
        result = json::toDisplayString(input.at(std::string(primaryKey)));

    auto rest = std::string {};
    for (auto const& [key, value]: input.items())
    {
        if (key == primaryKey)
            continue;
        if (!rest.empty())
            rest += ", ";
        rest += std::format("{}={}", key, json::toDisplayString(value));
    }
    if (!rest.empty())
    {
        if (!result.empty())
            result += ' ';
        result += std::format("({})", rest);
    }

    if (displayWidth(result) <= maxWidth)
        return result;
    if (maxWidth > 3)
        return takeColumns(result, maxWidth - 3) + "...";
    return takeColumns(result, std::max(maxWidth, 0));
}

// =============================================================================
// TextItem
// =============================================================================

TextItem::TextItem(std::string id, std::string content, TextTone tone):
    Item(std::move(id)), _content(std::move(content)), _tone(tone)
{
}

void TextItem::appendText(std::string_view delta)
{
    _content += delta;
    invalidate();
}

auto TextItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto lines = std::vector<TextLine> {};

    if (_tone == TextTone::Assistant)
    {
        for (auto& row: MarkdownRenderer(theme.markdown).render(_content, borderedWidth(width)))
        {
            auto line = TextLine::plain("│ ", theme.assistantBorder);
            for (auto& span: row.spans)
                line.spans.push_back(std::move(span));
            lines.push_back(std::move(line));
        }
        return lines;
    }

    auto const& body = _tone == TextTone::Error ? theme.finishError : theme.finishCanceled;
    for (auto& row: wrapText(_content, borderedWidth(width)))
    {
        auto line = TextLine::plain("│ ", theme.assistantBorder);
        line.append(std::move(row), body);
        lines.push_back(std::move(line));
    }
    return lines;
}

// =============================================================================
// UserItem
// =============================================================================

UserItem::UserItem(std::string id, std::string content): Item(std::move(id)), _content(std::move(content))
{
}

auto UserItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto const rows = wrapText(_content, borderedWidth(width));

    auto blockWidth = 0;
    for (auto const& row: rows)
        blockWidth = std::max(blockWidth, displayWidth(row));
    auto const indent = std::max(width - blockWidth - 2, 0);

    auto lines = std::vector<TextLine> {};
    for (auto const& row: rows)
    {
        auto line = TextLine {};
        line.append(std::string(static_cast<std::size_t>(indent), ' '));
        line.append(padRight(row, blockWidth), theme.userText);
        line.append(" │", theme.userBorder);
        lines.push_back(std::move(line));
    }
    return lines;
}

// =============================================================================
// ThinkingItem
// =============================================================================

ThinkingItem::ThinkingItem(std::string id, std::string content): Item(std::move(id)), _content(std::move(content))
{
}

void ThinkingItem::appendText(std::string_view delta)
{
    _content += delta;
    invalidate();
}

void ThinkingItem::finish(std::chrono::milliseconds duration)
{
    _finished = true;
    _duration = duration;
    invalidate();
}

void ThinkingItem::toggleExpanded()
{
    _collapsed = !_collapsed;
    invalidate();
}

auto ThinkingItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto const innerWidth = std::max(width - 2, 1);
    auto source = splitLines(_content);

    auto lines = std::vector<TextLine> {};
    if (_collapsed && std::ssize(source) > CollapsedLines)
    {
        auto const hidden = std::ssize(source) - CollapsedLines;
        lines.push_back(TextLine::plain(std::format("  … ({} lines hidden)", hidden), theme.thinkingHint));
        source.erase(source.begin(), source.begin() + hidden);
    }

    for (auto const& sourceLine: source)
        for (auto& row: wrapText(sourceLine, innerWidth))
            lines.push_back(TextLine::plain("  " + row, theme.thinkingContent));

    if (_finished && _duration.count() > 0)
    {
        auto footer = TextLine::plain("  Thought for ", theme.thinkingFooter);
        footer.append(formatDuration(_duration), theme.textMuted);
        lines.push_back(std::move(footer));
    }
    return lines;
}

// =============================================================================
// ToolItem
// =============================================================================

ToolItem::ToolItem(std::string id, std::string name, std::string toolKind, ToolStatus status, nlohmann::json input,
                   std::string output):
    Item(std::move(id)),
    _name(std::move(name)),
    _toolKind(std::move(toolKind)),
    _status(status),
    _input(std::move(input)),
    _output(std::move(output))
{
}

void ToolItem::setStatus(ToolStatus status)
{
    _status = status;
    invalidate();
}

void ToolItem::setToolKind(std::string toolKind)
{
    _toolKind = std::move(toolKind);
    invalidate();
}

void ToolItem::setInput(nlohmann::json input)
{
    _input = std::move(input);
    invalidate();
}

void ToolItem::setOutput(std::string output)
{
    _output = std::move(output);
    invalidate();
}

void ToolItem::toggleExpanded()
{
    _expanded = !_expanded;
    invalidate();
}

auto ToolItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto const icon = statusIcon(_status);
    auto const displayName = capitalized(_name);

    auto header = TextLine::plain("  ");
    header.append(std::string(icon.glyph), icon.style);
    header.append(" ");
    header.append(displayName, theme.toolName);

    if (_input.is_object() && !_input.empty())
    {
        // Edits and file writes show only the path; their body carries the rest.
        auto paramInput = _input;
        if (_toolKind == "edit" || (_input.contains("content") && _input.contains("filePath")))
        {
            paramInput = nlohmann::json::object();
            if (_input.contains("filePath"))
                paramInput["filePath"] = _input["filePath"];
        }
        auto const paramWidth = std::max(width - (3 + displayWidth(displayName)), 10);
        if (auto params = formatToolParams(paramInput, paramWidth); !params.empty())
        {
            header.append(" ");
            header.append(std::move(params), theme.toolParams);
        }
    }

    auto lines = std::vector<TextLine> {};
    lines.push_back(std::move(header));
    appendOutputBlock(lines, _output, width, _status == ToolStatus::Error, _expanded);
    return lines;
}

// =============================================================================
// HookItem
// =============================================================================

HookItem::HookItem(std::string id, std::string hookType, std::string command):
    Item(std::move(id)), _hookType(std::move(hookType)), _command(std::move(command))
{
}

void HookItem::setResult(ToolStatus status, std::string output, std::chrono::milliseconds duration)
{
    _status = status;
    _output = std::move(output);
    _duration = duration;
    invalidate();
}

void HookItem::toggleExpanded()
{
    _expanded = !_expanded;
    invalidate();
}

auto HookItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto const icon = statusIcon(_status);
    auto const title = std::format("Hook {}", _hookType);

    auto header = TextLine::plain("  ");
    header.append(std::string(icon.glyph), icon.style);
    header.append(" ");
    header.append(title, theme.toolName);

    auto const finished = _status != ToolStatus::Pending && _status != ToolStatus::Running;
    auto const durationText =
        finished && _duration.count() > 0 ? std::format(" ({})", formatDuration(_duration)) : std::string {};

    if (!_command.empty())
    {
        auto const commandWidth = std::max(width - (4 + displayWidth(title) + displayWidth(durationText)), 10);
        header.append(" ");
        header.append(truncate(_command, commandWidth), theme.toolParams);
    }
    header.append(durationText, theme.infoDuration);

    auto lines = std::vector<TextLine> {};
    lines.push_back(std::move(header));
    appendOutputBlock(lines, _output, width, _status == ToolStatus::Error, _expanded);
    return lines;
}

// =============================================================================
// SubagentItem
// =============================================================================

SubagentItem::SubagentItem(std::string id, std::string subagentType, std::string description, ToolStatus status,
                           std::string sessionId):
    Item(std::move(id)),
    _subagentType(std::move(subagentType)),
    _description(std::move(description)),
    _status(status),
    _sessionId(std::move(sessionId))
{
}

void SubagentItem::setStatus(ToolStatus status)
{
    _status = status;
    invalidate();
}

void SubagentItem::setSessionId(std::string sessionId)
{
    _sessionId = std::move(sessionId);
    invalidate();
}

auto SubagentItem::layout(int width) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto const boxWidth = std::max(width - 4, 20);
    auto const innerWidth = boxWidth - 4;
    auto const icon = statusIcon(_status);
    auto const& border = theme.subagentBorder;

    auto lines = std::vector<TextLine> {};
    auto const boxRow = [&](TextLine content) {
        auto const used = content.width();
        auto line = TextLine::plain("  ");
        line.append("│ ", border);
        for (auto& span: content.spans)
            line.spans.push_back(std::move(span));
        line.append(std::string(static_cast<std::size_t>(std::max(innerWidth - used, 0)), ' '));
        line.append(" │", border);
        lines.push_back(std::move(line));
    };

    lines.push_back(TextLine::plain("  ╭" + repeat(Rule, boxWidth - 2) + "╮", border));

    auto header = TextLine::plain(std::string(icon.glyph), icon.style);
    header.append(" ");
    header.append(takeColumns(std::format("[{}]", _subagentType), innerWidth - 2), theme.toolName);
    auto const status = std::string(subagentStatusText(_status));
    if (header.width() + 1 + displayWidth(status) <= innerWidth)
    {
        header.append(" ");
        header.append(status, theme.toolParams);
    }
    boxRow(std::move(header));

    for (auto& row: wrapText(_description, innerWidth - 2))
        boxRow(TextLine::plain("  " + row, theme.textNormal));

    if (!_sessionId.empty())
    {
        boxRow(TextLine {});
        boxRow(TextLine::plain("[Click to view]", theme.subagentHint));
    }

    lines.push_back(TextLine::plain("  ╰" + repeat(Rule, boxWidth - 2) + "╯", border));
    return lines;
}

// =============================================================================
// InfoItem
// =============================================================================

InfoItem::InfoItem(std::string id, std::string model, std::string provider, std::chrono::milliseconds duration):
    Item(std::move(id)), _model(std::move(model)), _provider(std::move(provider)), _duration(duration)
{
}

auto InfoItem::layout(int /*width*/) const -> std::vector<TextLine>
{
    auto const& theme = currentTheme();
    auto line = TextLine::plain("◇ ", theme.infoIcon);
    if (!_model.empty())
    {
        line.append(_model, theme.infoModel);
        line.append(" ");
        if (!_provider.empty())
        {
            line.append("via ", theme.infoProvider);
            line.append(_provider, theme.infoProvider);
            line.append(" ");
        }
    }
    line.append("⏱ ", theme.infoDuration);
    line.append(formatDuration(_duration), theme.infoDuration);
    return { std::move(line) };
}

// =============================================================================
// DividerItem
// =============================================================================

DividerItem::DividerItem(std::string id, int iteration): Item(std::move(id)), _iteration(iteration)
{
}

auto DividerItem::layout(int width) const -> std::vector<TextLine>
{
    auto const label = std::format(" Iteration #{} ", _iteration);
    auto const side = repeat(Rule, std::max(3, (width - displayWidth(label)) / 2));
    return { TextLine::plain(side + label + side, currentTheme().iterationDivider) };
}

} // namespace tailview::tui
