// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>
#include <vector>

#include <tui/Text.hpp>

namespace tailview::tui
{

/// @brief Styles used when laying out markdown.
struct MarkdownTheme
{
    Style text;
    Style heading1;
    Style heading2;
    Style heading3;
    Style codeBlock;
    Style codeInline;
    Style bold;
    Style italic;
    Style link;
    Style listMarker;
    Style blockquote;
    Style rule;
};

/// @brief Lays out a subset of markdown as styled rows of a given width.
///
/// Supports:
/// - Headings (# through ######)
/// - Fenced code blocks (``` and ~~~), which are broken at the width but never reflowed
/// - Inline code, **bold**, __bold__, *italic* and [links](url)
/// - Ordered and unordered list items, continuation rows indented under the text
/// - Blockquotes (>) and horizontal rules (---, ***, ___)
///
/// Each source line is wrapped on its own; blank lines become blank rows.
class MarkdownRenderer
{
  public:
    explicit MarkdownRenderer(MarkdownTheme theme);

    /// @brief Lays out @p markdown at @p width columns.
    /// @return At least one row; trailing blank rows are dropped.
    [[nodiscard]] auto render(std::string_view markdown, int width) const -> std::vector<TextLine>;

  private:
    void renderLine(std::string_view line, int width, std::vector<TextLine>& out) const;
    void renderCode(std::string_view line, int width, std::vector<TextLine>& out) const;
    [[nodiscard]] auto renderInline(std::string_view text, Style const& base) const -> std::vector<TextSpan>;
    [[nodiscard]] auto headingStyle(int level) const -> Style const&;

    MarkdownTheme _theme;
};

} // namespace tailview::tui
