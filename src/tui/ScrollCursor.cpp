// SPDX-License-Identifier: Apache-2.0
#include <tui/ScrollCursor.hpp>

#include <algorithm>
#include <limits>

namespace tailview::tui
{

namespace
{
    auto lastRow(std::size_t count, HeightProvider const& height) -> ScrollCursor
    {
        auto const last = count - 1;
        return ScrollCursor { .item = last, .line = std::max(height(last) - 1, 0) };
    }
} // namespace

auto scrollBy(ScrollCursor cursor, int delta, std::size_t count, HeightProvider const& height) -> ScrollCursor
{
    if (count == 0)
        return {};

    cursor = clampCursor(cursor, count, height);

    if (delta > 0)
    {
        while (delta > 0 && cursor.item < count)
        {
            auto const remaining = height(cursor.item) - cursor.line;
            if (delta >= remaining)
            {
                delta -= remaining;
                ++cursor.item;
                cursor.line = 0;
            }
            else
            {
                cursor.line += delta;
                delta = 0;
            }
        }
        if (cursor.item >= count)
            cursor = lastRow(count, height);
        return cursor;
    }

    // -INT_MIN is not representable.
    delta = std::max(delta, -std::numeric_limits<int>::max());
    while (delta < 0)
    {
        auto const back = -delta;
        if (back <= cursor.line)
        {
            cursor.line -= back;
            break;
        }
        if (cursor.item == 0)
        {
            cursor.line = 0;
            break;
        }
        // Enter the previous item from below: its last row is one step up.
        delta += cursor.line;
        --cursor.item;
        cursor.line = height(cursor.item);
    }
    return clampCursor(cursor, count, height);
}

auto clampCursor(ScrollCursor cursor, std::size_t count, HeightProvider const& height) -> ScrollCursor
{
    if (count == 0)
        return {};

    cursor.item = std::min(cursor.item, count - 1);
    auto const itemHeight = height(cursor.item);
    if (itemHeight <= 0)
        cursor.line = 0;
    else
        cursor.line = std::clamp(cursor.line, 0, itemHeight - 1);
    return cursor;
}

auto totalLines(std::size_t count, HeightProvider const& height) -> int
{
    auto total = 0;
    for (auto i = std::size_t { 0 }; i < count; ++i)
        total += height(i);
    return total;
}

auto lineOfCursor(ScrollCursor cursor, std::size_t count, HeightProvider const& height) -> int
{
    auto row = 0;
    for (auto i = std::size_t { 0 }; i < cursor.item && i < count; ++i)
        row += height(i);
    return row + cursor.line;
}

auto cursorAtLine(int target, std::size_t count, HeightProvider const& height) -> ScrollCursor
{
    if (count == 0)
        return {};

    target = std::max(target, 0);
    auto running = 0;
    for (auto i = std::size_t { 0 }; i < count; ++i)
    {
        auto const itemHeight = height(i);
        if (running + itemHeight > target)
            return ScrollCursor { .item = i, .line = target - running };
        running += itemHeight;
    }
    return lastRow(count, height);
}

auto bottomCursor(std::size_t count, int viewportHeight, HeightProvider const& height, int gap) -> ScrollCursor
{
    if (count == 0)
        return {};

    gap = std::max(gap, 0);
    viewportHeight = std::max(viewportHeight, 0);

    // Walk up from the last item, counting drawn rows until the window is full.
    auto rows = 0;
    for (auto i = count; i-- > 0;)
    {
        auto const itemHeight = height(i);
        auto const itemRows = itemHeight + (i + 1 < count ? gap : 0);
        if (rows + itemRows >= viewportHeight)
        {
            auto const skip = rows + itemRows - viewportHeight;
            if (skip < itemHeight)
                return ScrollCursor { .item = i, .line = skip };
            return clampCursor(ScrollCursor { .item = i + 1, .line = 0 }, count, height);
        }
        rows += itemRows;
    }
    return {};
}

} // namespace tailview::tui
