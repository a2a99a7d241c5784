// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <random>
#include <vector>

#include <tui/ScrollCursor.hpp>

using namespace tailview::tui;

namespace
{
auto heightsOf(std::vector<int> const& heights) -> HeightProvider
{
    return [heights](std::size_t index) {
        return heights.at(index);
    };
}
} // namespace

TEST_CASE("ScrollCursor: scrolling down within and across items", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(scrollBy({}, 2, heights.size(), height) == ScrollCursor { .item = 0, .line = 2 });
    CHECK(scrollBy({ .item = 0, .line = 2 }, 3, heights.size(), height) == ScrollCursor { .item = 1, .line = 0 });
    CHECK(scrollBy({}, 8, heights.size(), height) == ScrollCursor { .item = 2, .line = 0 });
    CHECK(scrollBy({}, 10, heights.size(), height) == ScrollCursor { .item = 2, .line = 2 });
}

TEST_CASE("ScrollCursor: scrolling down past the end stops on the last row", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    CHECK(scrollBy({}, 100, heights.size(), heightsOf(heights)) == ScrollCursor { .item = 2, .line = 3 });
}

TEST_CASE("ScrollCursor: scrolling up enters the previous item from below", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(scrollBy({ .item = 2, .line = 1 }, -1, heights.size(), height) == ScrollCursor { .item = 2, .line = 0 });
    CHECK(scrollBy({ .item = 2, .line = 1 }, -3, heights.size(), height) == ScrollCursor { .item = 1, .line = 1 });
    CHECK(scrollBy({ .item = 2, .line = 0 }, -1, heights.size(), height) == ScrollCursor { .item = 1, .line = 2 });
    CHECK(scrollBy({ .item = 2, .line = 0 }, -8, heights.size(), height) == ScrollCursor { .item = 0, .line = 0 });
}

TEST_CASE("ScrollCursor: scrolling up past the start stops at the top", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    CHECK(scrollBy({ .item = 1, .line = 2 }, -50, heights.size(), heightsOf(heights)) == ScrollCursor {});
}

TEST_CASE("ScrollCursor: empty list always yields the origin", "[tui][cursor]")
{
    auto const height = heightsOf({});
    CHECK(scrollBy({ .item = 3, .line = 7 }, 5, 0, height) == ScrollCursor {});
    CHECK(clampCursor({ .item = 3, .line = 7 }, 0, height) == ScrollCursor {});
    CHECK(bottomCursor(0, 10, height) == ScrollCursor {});
    CHECK(totalLines(0, height) == 0);
}

TEST_CASE("ScrollCursor: clampCursor restores bounds", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(clampCursor({ .item = 9, .line = 0 }, heights.size(), height) == ScrollCursor { .item = 2, .line = 0 });
    CHECK(clampCursor({ .item = 1, .line = 9 }, heights.size(), height) == ScrollCursor { .item = 1, .line = 2 });
    CHECK(clampCursor({ .item = 0, .line = -4 }, heights.size(), height) == ScrollCursor { .item = 0, .line = 0 });
    CHECK(clampCursor({ .item = 0, .line = 3 }, 1, heightsOf({ 0 })) == ScrollCursor { .item = 0, .line = 0 });
}

TEST_CASE("ScrollCursor: global row arithmetic", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(totalLines(heights.size(), height) == 12);
    CHECK(lineOfCursor({ .item = 2, .line = 1 }, heights.size(), height) == 9);
    CHECK(cursorAtLine(9, heights.size(), height) == ScrollCursor { .item = 2, .line = 1 });
    CHECK(cursorAtLine(5, heights.size(), height) == ScrollCursor { .item = 1, .line = 0 });
    CHECK(cursorAtLine(100, heights.size(), height) == ScrollCursor { .item = 2, .line = 3 });
}

TEST_CASE("ScrollCursor: bottomCursor shows the last rows", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(bottomCursor(heights.size(), 4, height) == ScrollCursor { .item = 2, .line = 0 });
    CHECK(bottomCursor(heights.size(), 5, height) == ScrollCursor { .item = 1, .line = 2 });
    CHECK(bottomCursor(heights.size(), 12, height) == ScrollCursor {});
    CHECK(bottomCursor(heights.size(), 40, height) == ScrollCursor {});
}

TEST_CASE("ScrollCursor: heights 5, 1, 8 in a 4-row window", "[tui][cursor]")
{
    SECTION("without separators")
    {
        auto const heights = std::vector { 5, 1, 8 };
        CHECK(bottomCursor(heights.size(), 4, heightsOf(heights)) == ScrollCursor { .item = 2, .line = 4 });
    }

    SECTION("with one separator row after each item but the last")
    {
        auto const heights = std::vector { 5, 1, 8 };
        CHECK(bottomCursor(heights.size(), 4, heightsOf(heights), 1) == ScrollCursor { .item = 2, .line = 4 });
    }
}

TEST_CASE("ScrollCursor: bottomCursor counts separator rows", "[tui][cursor]")
{
    auto const heights = std::vector { 2, 2, 2 };
    auto const height = heightsOf(heights);

    CHECK(bottomCursor(heights.size(), 4, height, 1) == ScrollCursor { .item = 1, .line = 1 });
    CHECK(bottomCursor(heights.size(), 8, height, 1) == ScrollCursor {});

    // A window starting on a separator row starts at the next item instead.
    CHECK(bottomCursor(heights.size(), 6, height, 1) == ScrollCursor { .item = 1, .line = 0 });
    CHECK(bottomCursor(2, 4, heightsOf({ 3, 3 }), 1) == ScrollCursor { .item = 1, .line = 0 });
}

TEST_CASE("ScrollCursor: extreme deltas clamp", "[tui][cursor]")
{
    auto const heights = std::vector { 5, 3, 4 };
    auto const height = heightsOf(heights);

    CHECK(scrollBy({ .item = 2, .line = 1 }, std::numeric_limits<int>::min(), heights.size(), height)
          == ScrollCursor {});
    CHECK(scrollBy({}, std::numeric_limits<int>::max(), heights.size(), height)
          == ScrollCursor { .item = 2, .line = 3 });
}

TEST_CASE("ScrollCursor: down then up returns to the start when nothing clamps", "[tui][cursor]")
{
    auto rng = std::mt19937 { 4711 };
    for (auto round = 0; round < 200; ++round)
    {
        auto heights = std::vector<int> {};
        auto const count = std::uniform_int_distribution<int> { 1, 12 }(rng);
        for (auto i = 0; i < count; ++i)
            heights.push_back(std::uniform_int_distribution<int> { 1, 9 }(rng));
        auto const height = heightsOf(heights);
        auto const total = totalLines(heights.size(), height);

        auto const startRow = std::uniform_int_distribution<int> { 0, total - 1 }(rng);
        auto const start = cursorAtLine(startRow, heights.size(), height);
        auto const delta = std::uniform_int_distribution<int> { 0, total - 1 - startRow }(rng);

        auto const moved = scrollBy(start, delta, heights.size(), height);
        CHECK(lineOfCursor(moved, heights.size(), height) == startRow + delta);
        CHECK(scrollBy(moved, -delta, heights.size(), height) == start);
    }
}
