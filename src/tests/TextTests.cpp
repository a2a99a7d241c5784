// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <tui/Text.hpp>

using namespace tailview::tui;

using Rows = std::vector<std::string>;

// =============================================================================
// Display width
// =============================================================================

TEST_CASE("Text: displayWidth", "[tui][text]")
{
    CHECK(displayWidth("") == 0);
    CHECK(displayWidth("hello") == 5);
    CHECK(displayWidth("\t") == 0);
    CHECK(displayWidth("中文") == 4);
    CHECK(displayWidth("é") == 1);
    CHECK(displayWidth("▸ ") == 2);
}

TEST_CASE("Text: graphemeClusters keeps combining marks together", "[tui][text]")
{
    auto const clusters = graphemeClusters("e\xCC\x81x"); // e + combining acute, x
    REQUIRE(clusters.size() == 2);
    CHECK(clusters[0] == "e\xCC\x81");
    CHECK(clusters[1] == "x");
}

// =============================================================================
// Wrapping
// =============================================================================

TEST_CASE("Text: wrapText packs words greedily", "[tui][text]")
{
    CHECK(wrapText("Hello world test", 11) == Rows { "Hello world", "test" });
    CHECK(wrapText("Hello world test", 80) == Rows { "Hello world test" });
}

TEST_CASE("Text: wrapText breaks words longer than the row", "[tui][text]")
{
    CHECK(wrapText("abcdefghij", 4) == Rows { "abcd", "efgh", "ij" });
    CHECK(wrapText("中文中文", 3) == Rows { "中", "文中", "文" });
}

TEST_CASE("Text: wrapText edge cases", "[tui][text]")
{
    SECTION("empty text yields one empty row")
    {
        CHECK(wrapText("", 10) == Rows { "" });
    }

    SECTION("newlines keep empty rows")
    {
        CHECK(wrapText("a\n\nb", 10) == Rows { "a", "", "b" });
    }

    SECTION("runs of blanks collapse")
    {
        CHECK(wrapText("a    b", 10) == Rows { "a b" });
    }

    SECTION("width below one behaves like one")
    {
        CHECK(wrapText("ab", 0) == Rows { "a", "b" });
    }
}

TEST_CASE("Text: wrapText rows never exceed the width", "[tui][text]")
{
    auto const text = std::string { "The quick brown fox jumps over the lazy dog, then naps under a tree." };
    for (auto width = 1; width <= 30; ++width)
        for (auto const& row: wrapText(text, width))
            CHECK(displayWidth(row) <= width);
}

TEST_CASE("Text: splitLines", "[tui][text]")
{
    CHECK(splitLines("") == Rows { "" });
    CHECK(splitLines("one") == Rows { "one" });
    CHECK(splitLines("a\nb\n") == Rows { "a", "b", "" });
}

// =============================================================================
// Column helpers
// =============================================================================

TEST_CASE("Text: takeColumns cuts at cluster boundaries", "[tui][text]")
{
    CHECK(takeColumns("hello", 3) == "hel");
    CHECK(takeColumns("hello", 10) == "hello");
    CHECK(takeColumns("中文", 3) == "中");
    CHECK(takeColumns("abc", 0).empty());
}

TEST_CASE("Text: truncate ends in an ellipsis", "[tui][text]")
{
    CHECK(truncate("hello", 5) == "hello");
    CHECK(truncate("hello world", 6) == "hello…");
    CHECK(truncate("hello", 0).empty());
}

TEST_CASE("Text: padRight and repeat", "[tui][text]")
{
    CHECK(padRight("ab", 4) == "ab  ");
    CHECK(padRight("abcdef", 4) == "abcdef");
    CHECK(padRight("中", 3) == "中 ");
    CHECK(repeat("─", 3) == "───");
    CHECK(repeat("x", 0).empty());
    CHECK(repeat("x", -2).empty());
}

// =============================================================================
// TextLine
// =============================================================================

TEST_CASE("TextLine: spans and width", "[tui][text]")
{
    auto line = TextLine {};
    line.append("│ ");
    line.append("");
    line.append("hi", Style { .bold = true });

    REQUIRE(line.spans.size() == 2);
    CHECK(line.plainText() == "│ hi");
    CHECK(line.width() == 4);
    CHECK(TextLine::plain("").spans.empty());
}

TEST_CASE("TextLine: equality compares text and style", "[tui][text]")
{
    CHECK(TextLine::plain("x") == TextLine::plain("x"));
    CHECK_FALSE(TextLine::plain("x") == TextLine::plain("y"));
    CHECK_FALSE(TextLine::plain("x") == TextLine::plain("x", Style { .dim = true }));
    CHECK_FALSE(TextLine::plain("x", Style { .fg = std::uint8_t { 1 } })
                == TextLine::plain("x", Style { .fg = std::uint8_t { 2 } }));
}
