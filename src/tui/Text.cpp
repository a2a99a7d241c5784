// SPDX-License-Identifier: Apache-2.0
#include <tui/Text.hpp>

#include <libunicode/convert.h>
#include <libunicode/utf8_grapheme_segmenter.h>
#include <libunicode/width.h>

#include <algorithm>
#include <ranges>

namespace tailview::tui
{

namespace
{
    constexpr auto Ellipsis = std::string_view { "…" };

    auto isAscii(std::string_view text) noexcept -> bool
    {
        return std::ranges::all_of(text, [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    }

    auto asciiWidth(std::string_view text) noexcept -> int
    {
        return static_cast<int>(std::ranges::count_if(text, [](char c) { return c >= 0x20 && c != 0x7F; }));
    }

    auto clusterWidth(std::string_view cluster) -> int
    {
        if (cluster.size() == 1)
            return asciiWidth(cluster);

        auto width = 0;
        auto first = true;
        for (auto const ch: unicode::convert_to<char32_t>(cluster))
        {
            if (first)
                width = unicode::width(ch);
            else if (ch == 0xFE0F) // emoji presentation selector
                width = 2;
            first = false;
        }
        return std::max(width, 0);
    }

    auto isBlank(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\r';
    }

    /// Greedy word packing of one newline-free paragraph.
    void wrapParagraph(std::string_view paragraph, int width, std::vector<std::string>& out)
    {
        auto const rowsBefore = out.size();
        auto line = std::string {};
        auto lineWidth = 0;

        auto const flush = [&] {
            out.push_back(std::move(line));
            line.clear();
            lineWidth = 0;
        };

        auto const placeWord = [&](std::string_view word) {
            auto const wordWidth = displayWidth(word);
            if (!line.empty() && lineWidth + 1 + wordWidth <= width)
            {
                line += ' ';
                line += word;
                lineWidth += 1 + wordWidth;
                return;
            }
            if (!line.empty())
                flush();
            if (wordWidth <= width)
            {
                line = std::string(word);
                lineWidth = wordWidth;
                return;
            }
            // Hard-break an overlong word; its tail stays open for the next word.
            for (auto const cluster: graphemeClusters(word))
            {
                auto const w = clusterWidth(cluster);
                if (lineWidth + w > width && !line.empty())
                    flush();
                line += cluster;
                lineWidth += w;
            }
        };

        auto pos = std::size_t { 0 };
        while (pos < paragraph.size())
        {
            while (pos < paragraph.size() && isBlank(paragraph[pos]))
                ++pos;
            auto const start = pos;
            while (pos < paragraph.size() && !isBlank(paragraph[pos]))
                ++pos;
            if (pos > start)
                placeWord(paragraph.substr(start, pos - start));
        }

        if (!line.empty() || out.size() == rowsBefore)
            out.push_back(std::move(line));
    }

    /// A blank-free run of text, possibly crossing style boundaries.
    struct StyledWord
    {
        std::vector<TextSpan> pieces;
        int width = 0;
    };

    auto splitWords(std::vector<TextSpan> const& spans) -> std::vector<StyledWord>
    {
        auto words = std::vector<StyledWord> {};
        auto current = StyledWord {};
        auto const finishWord = [&] {
            if (!current.pieces.empty())
                words.push_back(std::move(current));
            current = StyledWord {};
        };

        for (auto const& span: spans)
        {
            auto const& text = span.text;
            auto pos = std::size_t { 0 };
            while (pos < text.size())
            {
                if (isBlank(text[pos]) || text[pos] == '\n')
                {
                    finishWord();
                    ++pos;
                    continue;
                }
                auto const start = pos;
                while (pos < text.size() && !isBlank(text[pos]) && text[pos] != '\n')
                    ++pos;
                auto piece = text.substr(start, pos - start);
                current.width += displayWidth(piece);
                current.pieces.push_back(TextSpan { .text = std::move(piece), .style = span.style });
            }
        }
        finishWord();
        return words;
    }

    /// Appends to the last span when the style matches, else starts a new span.
    void appendMerged(TextLine& line, std::string_view text, Style const& style)
    {
        if (text.empty())
            return;
        if (!line.spans.empty() && sameStyle(line.spans.back().style, style))
            line.spans.back().text += text;
        else
            line.spans.push_back(TextSpan { .text = std::string(text), .style = style });
    }

    auto sameColor(Color const& a, Color const& b) -> bool
    {
        if (a.index() != b.index())
            return false;
        if (auto const* x = std::get_if<RgbColor>(&a))
        {
            auto const& y = std::get<RgbColor>(b);
            return x->r == y.r && x->g == y.g && x->b == y.b;
        }
        if (auto const* x = std::get_if<std::uint8_t>(&a))
            return *x == std::get<std::uint8_t>(b);
        return true;
    }
} // namespace

// =============================================================================
// TextLine
// =============================================================================

auto TextLine::width() const -> int
{
    auto total = 0;
    for (auto const& span: spans)
        total += displayWidth(span.text);
    return total;
}

auto TextLine::plainText() const -> std::string
{
    auto result = std::string {};
    for (auto const& span: spans)
        result += span.text;
    return result;
}

void TextLine::append(std::string text, Style const& style)
{
    if (text.empty())
        return;
    spans.push_back(TextSpan { .text = std::move(text), .style = style });
}

auto TextLine::plain(std::string text, Style const& style) -> TextLine
{
    auto line = TextLine {};
    line.append(std::move(text), style);
    return line;
}

auto TextLine::operator==(TextLine const& other) const -> bool
{
    return spans == other.spans;
}

auto operator==(TextSpan const& lhs, TextSpan const& rhs) -> bool
{
    return lhs.text == rhs.text && sameStyle(lhs.style, rhs.style);
}

auto sameStyle(Style const& lhs, Style const& rhs) -> bool
{
    return sameColor(lhs.fg, rhs.fg) && sameColor(lhs.bg, rhs.bg) && lhs.bold == rhs.bold
           && lhs.italic == rhs.italic && lhs.underline == rhs.underline && lhs.dim == rhs.dim
           && lhs.inverse == rhs.inverse;
}

// =============================================================================
// Free functions
// =============================================================================

auto graphemeClusters(std::string_view text) -> std::vector<std::string_view>
{
    auto clusters = std::vector<std::string_view> {};
    if (text.empty())
        return clusters;

    if (isAscii(text))
    {
        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
            clusters.push_back(text.substr(i, 1));
        return clusters;
    }

    // The segmenter's _clusterStart points into the original buffer.
    auto starts = std::vector<std::size_t> {};
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        starts.push_back(static_cast<std::size_t>(it._clusterStart - text.data()));

    for (auto i = std::size_t { 0 }; i < starts.size(); ++i)
    {
        auto const end = i + 1 < starts.size() ? starts[i + 1] : text.size();
        if (end > starts[i])
            clusters.push_back(text.substr(starts[i], end - starts[i]));
    }
    return clusters;
}

auto displayWidth(std::string_view text) -> int
{
    if (isAscii(text))
        return asciiWidth(text);

    auto width = 0;
    for (auto const cluster: graphemeClusters(text))
        width += clusterWidth(cluster);
    return width;
}

auto wrapText(std::string_view text, int width) -> std::vector<std::string>
{
    width = std::max(width, 1);
    auto result = std::vector<std::string> {};
    for (auto const paragraph: text | std::views::split('\n'))
        wrapParagraph(std::string_view(paragraph.begin(), paragraph.end()), width, result);
    if (result.empty())
        result.emplace_back();
    return result;
}

auto wrapSpans(std::vector<TextSpan> const& spans, int width, Style const& blankStyle) -> std::vector<TextLine>
{
    width = std::max(width, 1);
    auto rows = std::vector<TextLine> {};
    auto line = TextLine {};
    auto lineWidth = 0;

    auto const flush = [&] {
        rows.push_back(std::move(line));
        line = TextLine {};
        lineWidth = 0;
    };

    for (auto const& word: splitWords(spans))
    {
        if (lineWidth > 0 && lineWidth + 1 + word.width <= width)
        {
            appendMerged(line, " ", blankStyle);
            ++lineWidth;
        }
        else if (lineWidth > 0)
            flush();

        if (lineWidth + word.width <= width)
        {
            for (auto const& piece: word.pieces)
                appendMerged(line, piece.text, piece.style);
            lineWidth += word.width;
            continue;
        }

        // Hard-break an overlong word; its tail stays open for the next word.
        for (auto const& piece: word.pieces)
            for (auto const cluster: graphemeClusters(piece.text))
            {
                auto const w = clusterWidth(cluster);
                if (lineWidth + w > width && lineWidth > 0)
                    flush();
                appendMerged(line, cluster, piece.style);
                lineWidth += w;
            }
    }

    if (!line.spans.empty() || rows.empty())
        rows.push_back(std::move(line));
    return rows;
}

auto splitLines(std::string_view text) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (auto const part: text | std::views::split('\n'))
        result.emplace_back(part.begin(), part.end());
    if (result.empty())
        result.emplace_back();
    return result;
}

auto takeColumns(std::string_view text, int width) -> std::string
{
    auto result = std::string {};
    auto used = 0;
    for (auto const cluster: graphemeClusters(text))
    {
        auto const w = clusterWidth(cluster);
        if (used + w > width)
            break;
        result += cluster;
        used += w;
    }
    return result;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return {};
    if (displayWidth(text) <= width)
        return std::string(text);
    return takeColumns(text, width - 1) + std::string(Ellipsis);
}

auto padRight(std::string_view text, int width) -> std::string
{
    auto result = std::string(text);
    auto const missing = width - displayWidth(text);
    if (missing > 0)
        result.append(static_cast<std::size_t>(missing), ' ');
    return result;
}

auto repeat(std::string_view glyph, int count) -> std::string
{
    auto result = std::string {};
    for (auto i = 0; i < count; ++i)
        result += glyph;
    return result;
}

} // namespace tailview::tui
