// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/InputEvent.hpp>
#include <tui/Item.hpp>
#include <tui/ScrollCursor.hpp>
#include <tui/TerminalOutput.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tailview::tui
{

/// @brief Result of processing an input event in ScrollList.
enum class ScrollListAction : std::uint8_t
{
    None,    ///< Event not consumed.
    Changed, ///< Scroll position or follow mode changed, re-render needed.
};

/// @brief A virtualized, scrollable list of variable-height items.
///
/// Only the items intersecting the viewport are laid out when drawing; items
/// scrolled past are measured through their cached height. The list owns its
/// items. All calls must come from the UI thread.
class ScrollList
{
  public:
    ScrollList(int width, int height);

    // =========================================================================
    // Content
    // =========================================================================

    /// @brief Replaces all items, then clamps the cursor (or follows the tail).
    void setItems(std::vector<std::unique_ptr<Item>> items);

    /// @brief Appends an item; jumps to the bottom when auto-scroll is on.
    void appendItem(std::unique_ptr<Item> item);

    /// @brief Swaps the item at @p index for another one (e.g. a kind change).
    void replaceItem(std::size_t index, std::unique_ptr<Item> item);

    void clear();

    /// @brief Must be called after an item was mutated in place.
    void contentChanged();

    /// @brief Drops every item's cached layout.
    void invalidateAll();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _items.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _items.empty(); }
    [[nodiscard]] auto item(std::size_t index) -> Item* { return _items.at(index).get(); }
    [[nodiscard]] auto item(std::size_t index) const -> Item const* { return _items.at(index).get(); }
    [[nodiscard]] auto indexOf(std::string_view id) const -> std::optional<std::size_t>;

    // =========================================================================
    // Geometry and settings
    // =========================================================================

    void setWidth(int width);
    void setHeight(int height);
    void setSize(int width, int height);
    [[nodiscard]] auto width() const noexcept -> int { return _width; }
    [[nodiscard]] auto height() const noexcept -> int { return _height; }

    /// @brief Number of blank rows drawn between consecutive items.
    void setItemGap(int gap);
    [[nodiscard]] auto itemGap() const noexcept -> int { return _itemGap; }

    void setAutoScroll(bool enabled) noexcept { _autoScroll = enabled; }
    [[nodiscard]] auto autoScroll() const noexcept -> bool { return _autoScroll; }

    void setFocused(bool focused) noexcept { _focused = focused; }
    [[nodiscard]] auto focused() const noexcept -> bool { return _focused; }

    /// @brief Marks the item at @p index as selected; out of range clears it.
    void setSelected(int index) noexcept;
    [[nodiscard]] auto selectedIndex() const noexcept -> int { return _selected; }

    void setSelectionMarker(std::string marker) { _selectionMarker = std::move(marker); }

    // =========================================================================
    // Navigation
    // =========================================================================

    /// @brief Scrolls by @p delta content rows (negative is up).
    void scrollBy(int delta);
    void gotoTop();
    /// @brief Moves the cursor so the last row is at the bottom of the viewport.
    void gotoBottom();

    /// @brief True when the cursor is at or past the gotoBottom() position.
    ///
    /// With no separator rows this is `scrollOffset() + height() >= totalLineCount()`.
    [[nodiscard]] auto atBottom() -> bool;

    /// @brief Puts the first row of item @p index at the top, as far as possible.
    void scrollToItem(std::size_t index);

    [[nodiscard]] auto cursor() const noexcept -> ScrollCursor { return _cursor; }

    /// @brief Sum of all item heights; separator rows are not counted.
    [[nodiscard]] auto totalLineCount() -> int;

    /// @brief Global content row at the top of the viewport.
    [[nodiscard]] auto scrollOffset() -> int;

    /// @brief Fraction of scrollable distance covered, in [0, 1].
    [[nodiscard]] auto scrollPercent() -> double;

    /// @brief Index of the item drawn at viewport row @p row (0-based), if any.
    [[nodiscard]] auto itemAtRow(int row) -> std::optional<std::size_t>;

    /// @brief Handles PageUp/PageDown/Home/End while focused.
    [[nodiscard]] auto processEvent(InputEvent const& event) -> ScrollListAction;

    // =========================================================================
    // Drawing
    // =========================================================================

    /// @brief Visible rows joined by '\n', without a trailing newline.
    [[nodiscard]] auto view() -> std::string;

    /// @brief Visible rows with their styles, at most height() of them.
    [[nodiscard]] auto visibleRows() -> std::vector<TextLine>;

    /// @brief Paints the viewport at (@p row, @p col), 1-based, padding every row.
    void render(TerminalOutput& output, int row, int col);

  private:
    [[nodiscard]] auto heightOf(std::size_t index) -> int;
    [[nodiscard]] auto heightProvider() -> HeightProvider;
    [[nodiscard]] auto bottomOffset() -> int;
    void clampOffset();

    std::vector<std::unique_ptr<Item>> _items;
    ScrollCursor _cursor;
    int _width;
    int _height;
    int _itemGap = 1;
    bool _autoScroll = true;
    bool _focused = false;
    int _selected = -1;
    std::string _selectionMarker = "▸ ";
};

} // namespace tailview::tui
