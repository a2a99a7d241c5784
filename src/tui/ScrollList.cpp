// SPDX-License-Identifier: Apache-2.0
#include <tui/ScrollList.hpp>
#include <tui/Theme.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <variant>

namespace tailview::tui
{

ScrollList::ScrollList(int width, int height): _width(std::max(width, 0)), _height(std::max(height, 0))
{
}

// =============================================================================
// Content
// =============================================================================

void ScrollList::setItems(std::vector<std::unique_ptr<Item>> items)
{
    _items = std::move(items);
    if (_selected >= static_cast<int>(_items.size()))
        _selected = -1;
    clampOffset();
    if (_autoScroll)
        gotoBottom();
}

void ScrollList::appendItem(std::unique_ptr<Item> item)
{
    if (!item)
        return;
    _items.push_back(std::move(item));
    if (_autoScroll)
        gotoBottom();
}

void ScrollList::replaceItem(std::size_t index, std::unique_ptr<Item> item)
{
    if (!item || index >= _items.size())
        return;
    log::trace("ScrollList: replacing item {} ({} -> {})",
               index,
               itemKindName(_items[index]->kind()),
               itemKindName(item->kind()));
    _items[index] = std::move(item);
    contentChanged();
}

void ScrollList::clear()
{
    _items.clear();
    _cursor = {};
    _selected = -1;
}

void ScrollList::contentChanged()
{
    if (_autoScroll)
        gotoBottom();
    else
        clampOffset();
}

void ScrollList::invalidateAll()
{
    for (auto& item: _items)
        item->invalidate();
}

auto ScrollList::indexOf(std::string_view id) const -> std::optional<std::size_t>
{
    for (auto i = std::size_t { 0 }; i < _items.size(); ++i)
        if (_items[i]->id() == id)
            return i;
    return std::nullopt;
}

// =============================================================================
// Geometry and settings
// =============================================================================

void ScrollList::setWidth(int width)
{
    _width = std::max(width, 0);
    clampOffset();
}

void ScrollList::setHeight(int height)
{
    _height = std::max(height, 0);
    clampOffset();
}

void ScrollList::setSize(int width, int height)
{
    _width = std::max(width, 0);
    _height = std::max(height, 0);
    clampOffset();
}

void ScrollList::setItemGap(int gap)
{
    _itemGap = std::max(gap, 0);
    clampOffset();
}

void ScrollList::setSelected(int index) noexcept
{
    _selected = (index >= 0 && index < static_cast<int>(_items.size())) ? index : -1;
}

// =============================================================================
// Navigation
// =============================================================================

auto ScrollList::heightOf(std::size_t index) -> int
{
    auto& item = *_items[index];
    if (auto const height = item.height(); height > 0)
        return height;
    return static_cast<int>(item.render(_width).size());
}

auto ScrollList::heightProvider() -> HeightProvider
{
    return [this](std::size_t index) {
        return heightOf(index);
    };
}

void ScrollList::clampOffset()
{
    _cursor = clampCursor(_cursor, _items.size(), heightProvider());
}

void ScrollList::scrollBy(int delta)
{
    _cursor = tui::scrollBy(_cursor, delta, _items.size(), heightProvider());
    clampOffset();
}

void ScrollList::gotoTop()
{
    _cursor = {};
}

void ScrollList::gotoBottom()
{
    _cursor = bottomCursor(_items.size(), _height, heightProvider(), _itemGap);
}

auto ScrollList::bottomOffset() -> int
{
    auto const heights = heightProvider();
    return lineOfCursor(bottomCursor(_items.size(), _height, heights, _itemGap), _items.size(), heights);
}

auto ScrollList::atBottom() -> bool
{
    if (_items.empty())
        return true;
    return scrollOffset() >= bottomOffset();
}

void ScrollList::scrollToItem(std::size_t index)
{
    if (_items.empty())
        return;
    index = std::min(index, _items.size() - 1);

    auto const heights = heightProvider();
    auto const itemRow = lineOfCursor(ScrollCursor { .item = index, .line = 0 }, _items.size(), heights);
    _cursor = cursorAtLine(std::min(itemRow, bottomOffset()), _items.size(), heights);
}

auto ScrollList::totalLineCount() -> int
{
    return totalLines(_items.size(), heightProvider());
}

auto ScrollList::scrollOffset() -> int
{
    return lineOfCursor(_cursor, _items.size(), heightProvider());
}

auto ScrollList::scrollPercent() -> double
{
    if (_items.empty())
        return 0.0;
    auto const scrollable = bottomOffset();
    if (scrollable <= 0)
        return 1.0;
    return std::clamp(static_cast<double>(scrollOffset()) / static_cast<double>(scrollable), 0.0, 1.0);
}

auto ScrollList::itemAtRow(int row) -> std::optional<std::size_t>
{
    if (row < 0 || row >= _height || _items.empty())
        return std::nullopt;

    auto skip = _cursor.line;
    auto drawn = 0;
    for (auto i = _cursor.item; i < _items.size() && drawn < _height; ++i)
    {
        auto const contentRows = static_cast<int>(_items[i]->render(_width).size());
        if (skip > 0 && skip >= contentRows)
        {
            // Stale offset after a width change shrank the item.
            skip = 0;
            continue;
        }
        auto const rowCount = contentRows + (i + 1 < _items.size() ? _itemGap : 0);
        for (auto r = skip; r < rowCount && drawn < _height; ++r, ++drawn)
            if (drawn == row)
                return r < contentRows ? std::optional { i } : std::nullopt;
        skip = 0;
    }
    return std::nullopt;
}

auto ScrollList::processEvent(InputEvent const& event) -> ScrollListAction
{
    if (!_focused)
        return ScrollListAction::None;

    auto const* key = std::get_if<KeyEvent>(&event);
    if (!key)
        return ScrollListAction::None;

    switch (key->key)
    {
        case KeyCode::PageUp:
            scrollBy(-_height);
            _autoScroll = false;
            return ScrollListAction::Changed;
        case KeyCode::PageDown:
            scrollBy(_height);
            _autoScroll = atBottom();
            return ScrollListAction::Changed;
        case KeyCode::Home:
            gotoTop();
            _autoScroll = false;
            return ScrollListAction::Changed;
        case KeyCode::End:
            gotoBottom();
            _autoScroll = true;
            return ScrollListAction::Changed;
        default: return ScrollListAction::None;
    }
}

// =============================================================================
// Drawing
// =============================================================================

auto ScrollList::visibleRows() -> std::vector<TextLine>
{
    auto rows = std::vector<TextLine> {};
    if (_items.empty() || _height == 0)
        return rows;

    auto const& theme = currentTheme();
    auto skip = _cursor.line;
    for (auto i = _cursor.item; i < _items.size() && std::ssize(rows) < _height; ++i)
    {
        auto const& lines = _items[i]->render(_width);
        auto const contentRows = static_cast<int>(lines.size());
        if (skip > 0 && skip >= contentRows)
        {
            skip = 0;
            continue;
        }
        auto const rowCount = contentRows + (i + 1 < _items.size() ? _itemGap : 0);
        auto const selected = static_cast<int>(i) == _selected;
        auto markerPlaced = false;

        for (auto r = skip; r < rowCount && std::ssize(rows) < _height; ++r)
        {
            if (r >= contentRows)
            {
                rows.emplace_back();
                continue;
            }
            if (selected && !markerPlaced)
            {
                auto marked = TextLine::plain(_selectionMarker, theme.selectionMarker);
                for (auto const& span: lines[static_cast<std::size_t>(r)].spans)
                    marked.spans.push_back(span);
                rows.push_back(std::move(marked));
                markerPlaced = true;
                continue;
            }
            rows.push_back(lines[static_cast<std::size_t>(r)]);
        }
        skip = 0;
    }
    return rows;
}

auto ScrollList::view() -> std::string
{
    auto result = std::string {};
    auto first = true;
    for (auto const& row: visibleRows())
    {
        if (!first)
            result += '\n';
        result += row.plainText();
        first = false;
    }
    return result;
}

void ScrollList::render(TerminalOutput& output, int row, int col)
{
    auto const rows = visibleRows();
    for (auto r = 0; r < _height; ++r)
    {
        output.moveTo(row + r, col);
        auto used = 0;
        if (r < std::ssize(rows))
        {
            for (auto const& span: rows[static_cast<std::size_t>(r)].spans)
            {
                auto const remaining = _width - used;
                if (remaining <= 0)
                    break;
                auto const text = takeColumns(span.text, remaining);
                output.write(text, span.style);
                used += displayWidth(text);
            }
        }
        if (used < _width)
            output.write(std::string(static_cast<std::size_t>(_width - used), ' '));
    }
}

} // namespace tailview::tui
