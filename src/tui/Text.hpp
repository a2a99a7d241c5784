// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace tailview::tui
{

/// @brief A styled run of text within a line.
struct TextSpan
{
    std::string text;
    Style style;
};

auto operator==(TextSpan const& lhs, TextSpan const& rhs) -> bool;

/// @brief Compares two styles attribute by attribute.
[[nodiscard]] auto sameStyle(Style const& lhs, Style const& rhs) -> bool;

/// @brief One display row made of styled spans.
struct TextLine
{
    std::vector<TextSpan> spans;

    /// @brief Returns the display width of the line in terminal cells.
    [[nodiscard]] auto width() const -> int;

    /// @brief Returns the concatenated span text without styling.
    [[nodiscard]] auto plainText() const -> std::string;

    /// @brief Appends a span. Empty text is ignored.
    void append(std::string text, Style const& style = {});

    /// @brief Creates a single-span line.
    [[nodiscard]] static auto plain(std::string text, Style const& style = {}) -> TextLine;

    auto operator==(TextLine const&) const -> bool;
};

/// @brief Splits @p text into grapheme clusters.
[[nodiscard]] auto graphemeClusters(std::string_view text) -> std::vector<std::string_view>;

/// @brief Returns the display width of a string in terminal cells.
///
/// Wide (East Asian, emoji) clusters count 2, combining sequences count as
/// their base character, control characters count 0.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Wraps text to @p width cells.
///
/// Newlines start a new row. Words are packed greedily; runs of blanks between
/// words collapse to one space; a word wider than the row is broken at grapheme
/// boundaries. Always returns at least one (possibly empty) row.
[[nodiscard]] auto wrapText(std::string_view text, int width) -> std::vector<std::string>;

/// @brief Wraps styled text to @p width cells, keeping each word's styles.
///
/// Packs like wrapText(), but newlines count as blanks. Words may span several
/// styles; the single space between two words gets @p blankStyle. Adjacent runs
/// of the same style are merged. Always returns at least one (possibly empty) row.
[[nodiscard]] auto wrapSpans(std::vector<TextSpan> const& spans, int width, Style const& blankStyle = {})
    -> std::vector<TextLine>;

/// @brief Splits text at newlines, keeping empty rows.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string>;

/// @brief Truncates text to @p width cells, ending in an ellipsis when cut.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

/// @brief Returns at most @p width cells of @p text, cut at a grapheme boundary.
[[nodiscard]] auto takeColumns(std::string_view text, int width) -> std::string;

/// @brief Pads text with spaces on the right to @p width cells.
[[nodiscard]] auto padRight(std::string_view text, int width) -> std::string;

/// @brief Repeats @p glyph @p count times (count <= 0 yields an empty string).
[[nodiscard]] auto repeat(std::string_view glyph, int count) -> std::string;

} // namespace tailview::tui
