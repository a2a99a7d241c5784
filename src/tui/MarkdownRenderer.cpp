// SPDX-License-Identifier: Apache-2.0
#include <tui/MarkdownRenderer.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace tailview::tui
{

namespace
{
    /// @brief Checks if a line is a code fence (``` or ~~~, optionally with language tag).
    /// @return The fence string if it's a code fence, empty string otherwise.
    auto detectCodeFence(std::string_view line) -> std::string_view
    {
        auto pos = std::size_t { 0 };
        // Skip leading whitespace (up to 3 spaces)
        while (pos < line.size() && pos < 3 && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            return {};

        auto const fenceChar = line[pos];
        if (fenceChar != '`' && fenceChar != '~')
            return {};

        auto const fenceStart = pos;
        while (pos < line.size() && line[pos] == fenceChar)
            ++pos;

        if (pos - fenceStart >= 3)
            return line.substr(fenceStart, pos - fenceStart);

        return {};
    }

    /// @brief Counts the heading level (number of leading '#' chars).
    /// @return Heading level (1-6), or 0 if not a heading.
    auto detectHeadingLevel(std::string_view line) -> int
    {
        auto level = 0;
        while (level < static_cast<int>(line.size()) && level < 6
               && line[static_cast<std::size_t>(level)] == '#')
            ++level;
        if (level > 0 && level < static_cast<int>(line.size())
            && line[static_cast<std::size_t>(level)] == ' ')
            return level;
        return 0;
    }

    /// @brief Checks if a line starts with a list marker.
    /// @return The number of characters consumed by the marker (0 if not a list item).
    auto detectListMarker(std::string_view line) -> std::size_t
    {
        auto pos = std::size_t { 0 };
        while (pos < line.size() && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            return 0;

        // Unordered: - or * or +
        if ((line[pos] == '-' || line[pos] == '*' || line[pos] == '+') && pos + 1 < line.size()
            && line[pos + 1] == ' ')
            return pos + 2;

        // Ordered: digits followed by . or )
        auto const digitStart = pos;
        while (pos < line.size() && line[pos] >= '0' && line[pos] <= '9')
            ++pos;
        if (pos > digitStart && pos < line.size() && (line[pos] == '.' || line[pos] == ')')
            && pos + 1 < line.size() && line[pos + 1] == ' ')
            return pos + 2;

        return 0;
    }

    /// @brief Checks if a line starts with a blockquote marker (>).
    /// @return The number of characters consumed (0 if not a blockquote).
    auto detectBlockquote(std::string_view line) -> std::size_t
    {
        if (!line.empty() && line[0] == '>')
        {
            if (line.size() > 1 && line[1] == ' ')
                return 2;
            return 1;
        }
        return 0;
    }

    /// @brief Three or more of the same '-', '*' or '_', optionally separated by spaces.
    auto detectRule(std::string_view line) -> bool
    {
        auto marker = '\0';
        auto count = 0;
        for (auto const ch: line)
        {
            if (ch == ' ')
                continue;
            if (ch != '-' && ch != '*' && ch != '_')
                return false;
            if (marker != '\0' && ch != marker)
                return false;
            marker = ch;
            ++count;
        }
        return count >= 3;
    }

    auto isBlankLine(std::string_view line) -> bool
    {
        return std::ranges::all_of(line, [](char ch) { return ch == ' ' || ch == '\t' || ch == '\r'; });
    }
} // namespace

MarkdownRenderer::MarkdownRenderer(MarkdownTheme theme): _theme(std::move(theme))
{
}

auto MarkdownRenderer::render(std::string_view markdown, int width) const -> std::vector<TextLine>
{
    width = std::max(width, 1);

    auto out = std::vector<TextLine> {};
    auto codeFence = std::string {};

    auto pos = std::size_t { 0 };
    while (pos < markdown.size())
    {
        auto const lineEnd = markdown.find('\n', pos);
        auto line =
            (lineEnd != std::string_view::npos) ? markdown.substr(pos, lineEnd - pos) : markdown.substr(pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        auto const fence = detectCodeFence(line);
        if (!codeFence.empty())
        {
            if (!fence.empty() && fence.size() >= codeFence.size() && fence.front() == codeFence.front())
                codeFence.clear();
            else
                renderCode(line, width, out);
        }
        else if (!fence.empty())
            codeFence = std::string(fence);
        else
            renderLine(line, width, out);

        pos = (lineEnd != std::string_view::npos) ? lineEnd + 1 : markdown.size();
    }

    while (!out.empty() && out.back().spans.empty())
        out.pop_back();
    if (out.empty())
        out.emplace_back();
    return out;
}

void MarkdownRenderer::renderLine(std::string_view line, int width, std::vector<TextLine>& out) const
{
    if (isBlankLine(line))
    {
        out.emplace_back();
        return;
    }

    auto const headingLevel = detectHeadingLevel(line);
    if (headingLevel > 0)
    {
        auto const& style = headingStyle(headingLevel);
        auto const text = line.substr(static_cast<std::size_t>(headingLevel) + 1);
        for (auto& row: wrapSpans(renderInline(text, style), width, style))
            out.push_back(std::move(row));
        return;
    }

    auto const bqLen = detectBlockquote(line);
    if (bqLen > 0)
    {
        auto const inner = std::max(width - 2, 1);
        for (auto& row: wrapSpans(renderInline(line.substr(bqLen), _theme.blockquote), inner, _theme.blockquote))
        {
            auto quoted = TextLine::plain("│ ", _theme.blockquote);
            for (auto& span: row.spans)
                quoted.spans.push_back(std::move(span));
            out.push_back(std::move(quoted));
        }
        return;
    }

    if (detectRule(line))
    {
        out.push_back(TextLine::plain(repeat("─", width), _theme.rule));
        return;
    }

    auto const listLen = detectListMarker(line);
    if (listLen > 0)
    {
        auto const marker = line.substr(0, listLen);
        auto const markerWidth = displayWidth(marker);
        auto const inner = std::max(width - markerWidth, 1);
        auto const indent = std::string(static_cast<std::size_t>(markerWidth), ' ');

        auto first = true;
        for (auto& row: wrapSpans(renderInline(line.substr(listLen), _theme.text), inner, _theme.text))
        {
            auto item = first ? TextLine::plain(std::string(marker), _theme.listMarker) : TextLine::plain(indent);
            for (auto& span: row.spans)
                item.spans.push_back(std::move(span));
            out.push_back(std::move(item));
            first = false;
        }
        return;
    }

    for (auto& row: wrapSpans(renderInline(line, _theme.text), width, _theme.text))
        out.push_back(std::move(row));
}

void MarkdownRenderer::renderCode(std::string_view line, int width, std::vector<TextLine>& out) const
{
    if (line.empty())
    {
        out.emplace_back();
        return;
    }

    // Code keeps its spacing; only break where the row is full.
    auto row = std::string {};
    auto rowWidth = 0;
    for (auto const cluster: graphemeClusters(line))
    {
        auto const w = displayWidth(cluster);
        if (rowWidth + w > width && rowWidth > 0)
        {
            out.push_back(TextLine::plain(std::move(row), _theme.codeBlock));
            row.clear();
            rowWidth = 0;
        }
        row += cluster;
        rowWidth += w;
    }
    out.push_back(TextLine::plain(std::move(row), _theme.codeBlock));
}

auto MarkdownRenderer::renderInline(std::string_view text, Style const& base) const -> std::vector<TextSpan>
{
    auto spans = std::vector<TextSpan> {};
    auto const emit = [&](std::string_view piece, Style const& style) {
        if (!piece.empty())
            spans.push_back(TextSpan { .text = std::string(piece), .style = style });
    };

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        // Inline code: `...`
        if (text[pos] == '`')
        {
            auto const endTick = text.find('`', pos + 1);
            if (endTick != std::string_view::npos)
            {
                emit(text.substr(pos + 1, endTick - pos - 1), _theme.codeInline);
                pos = endTick + 1;
                continue;
            }
        }

        // Bold: **...**
        if (pos + 1 < text.size() && text[pos] == '*' && text[pos + 1] == '*')
        {
            auto const endBold = text.find("**", pos + 2);
            if (endBold != std::string_view::npos)
            {
                emit(text.substr(pos + 2, endBold - pos - 2), _theme.bold);
                pos = endBold + 2;
                continue;
            }
        }

        // Italic: *...*
        if (text[pos] == '*')
        {
            auto const endItalic = text.find('*', pos + 1);
            if (endItalic != std::string_view::npos)
            {
                emit(text.substr(pos + 1, endItalic - pos - 1), _theme.italic);
                pos = endItalic + 1;
                continue;
            }
        }

        // Bold: __...__
        if (pos + 1 < text.size() && text[pos] == '_' && text[pos + 1] == '_')
        {
            auto const endBold = text.find("__", pos + 2);
            if (endBold != std::string_view::npos)
            {
                emit(text.substr(pos + 2, endBold - pos - 2), _theme.bold);
                pos = endBold + 2;
                continue;
            }
        }

        // Link: [text](url)
        if (text[pos] == '[')
        {
            auto const endBracket = text.find(']', pos + 1);
            if (endBracket != std::string_view::npos && endBracket + 1 < text.size()
                && text[endBracket + 1] == '(')
            {
                auto const endParen = text.find(')', endBracket + 2);
                if (endParen != std::string_view::npos)
                {
                    emit(text.substr(pos + 1, endBracket - pos - 1), _theme.link);
                    pos = endParen + 1;
                    continue;
                }
            }
        }

        auto const nextSpecial = text.find_first_of("`*_[", pos + 1);
        auto const end = (nextSpecial != std::string_view::npos) ? nextSpecial : text.size();
        emit(text.substr(pos, end - pos), base);
        pos = end;
    }
    return spans;
}

auto MarkdownRenderer::headingStyle(int level) const -> Style const&
{
    switch (level)
    {
        case 1: return _theme.heading1;
        case 2: return _theme.heading2;
        default: return _theme.heading3;
    }
}

} // namespace tailview::tui
