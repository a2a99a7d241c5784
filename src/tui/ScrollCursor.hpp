// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>

namespace tailview::tui
{

/// @brief Position of the viewport's top row within a list of items.
///
/// `item` is the first visible item; `line` is the number of its leading rendered
/// rows scrolled off the top. Separator rows between items are not addressable.
/// Invariant: `line < height(item)` whenever that height is known and non-zero.
struct ScrollCursor
{
    std::size_t item = 0;
    int line = 0;

    auto operator==(ScrollCursor const&) const -> bool = default;
};

/// @brief Returns the rendered height of item @p index, rendering it first when unknown.
using HeightProvider = std::function<int(std::size_t)>;

/// @brief Moves @p cursor by @p delta rows across @p count items.
///
/// Forward movement never passes the last row of the last item; backward
/// movement stops at (0, 0).
[[nodiscard]] auto scrollBy(ScrollCursor cursor, int delta, std::size_t count, HeightProvider const& height)
    -> ScrollCursor;

/// @brief Restores `item < count` and `line < height(item)`; (0, 0) when empty.
[[nodiscard]] auto clampCursor(ScrollCursor cursor, std::size_t count, HeightProvider const& height) -> ScrollCursor;

/// @brief Sum of all item heights.
[[nodiscard]] auto totalLines(std::size_t count, HeightProvider const& height) -> int;

/// @brief Global content row addressed by @p cursor.
[[nodiscard]] auto lineOfCursor(ScrollCursor cursor, std::size_t count, HeightProvider const& height) -> int;

/// @brief Cursor addressing global content row @p target, or the last row when past the end.
[[nodiscard]] auto cursorAtLine(int target, std::size_t count, HeightProvider const& height) -> ScrollCursor;

/// @brief Cursor that puts the last row at the bottom of a @p viewportHeight window.
///
/// @p gap blank rows are drawn after every item but the last. With a zero gap this is
/// the cursor addressing row `totalLines - viewportHeight`. A window start falling on a
/// separator row moves to the next item, so the cursor never addresses a separator.
[[nodiscard]] auto bottomCursor(std::size_t count, int viewportHeight, HeightProvider const& height, int gap = 0)
    -> ScrollCursor;

} // namespace tailview::tui
