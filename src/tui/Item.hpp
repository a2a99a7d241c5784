// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/RenderCache.hpp>
#include <tui/Text.hpp>

namespace tailview::tui
{

/// @brief The closed set of item variants a ScrollList can hold.
enum class ItemKind : std::uint8_t
{
    Text,
    User,
    Thinking,
    Tool,
    Subagent,
    Hook,
    Info,
    Divider,
};

/// @brief Returns a short lowercase name for an item kind.
[[nodiscard]] auto itemKindName(ItemKind kind) noexcept -> std::string_view;

/// @brief One unit of content in a ScrollList.
///
/// Rendering goes through render(), which consults the width-keyed cache and
/// calls the variant's layout() only on a miss. Every mutation of a variant's
/// state must be followed by invalidate(); the mutating setters of the
/// concrete items do that themselves.
class Item
{
  public:
    explicit Item(std::string id);
    virtual ~Item() = default;

    Item(Item const&) = delete;
    auto operator=(Item const&) -> Item& = delete;
    Item(Item&&) = delete;
    auto operator=(Item&&) -> Item& = delete;

    /// @brief Stable identity used for merge-or-append by producers.
    [[nodiscard]] auto id() const noexcept -> std::string const& { return _id; }

    [[nodiscard]] virtual auto kind() const noexcept -> ItemKind = 0;

    /// @brief Returns the rows of this item laid out for @p width columns.
    ///
    /// Served from the cache when it is valid for exactly this width; otherwise
    /// laid out afresh and cached. Negative widths are treated as 0.
    auto render(int width) -> std::vector<TextLine> const&;

    /// @brief Cached row count, or 0 when the item has not been rendered since
    /// its last invalidation. 0 means "unknown", callers render to learn more.
    [[nodiscard]] auto height() const noexcept -> int { return _cache.height(); }

    /// @brief Marks the cached layout stale without discarding it.
    void invalidate() noexcept { _cache.invalidate(); }

    /// @brief Number of times layout() actually ran.
    [[nodiscard]] auto layoutCount() const noexcept -> int { return _layoutCount; }

    [[nodiscard]] auto cache() const noexcept -> RenderCache const& { return _cache; }

    /// @brief Whether clicking the item toggles between a short and a full form.
    [[nodiscard]] virtual auto expandable() const noexcept -> bool { return false; }
    [[nodiscard]] virtual auto expanded() const noexcept -> bool { return false; }

    /// @brief Flips the expanded state and invalidates. No-op for fixed items.
    virtual void toggleExpanded() {}

  protected:
    /// @brief Produces the rows for @p width. Must not touch the cache or do I/O.
    [[nodiscard]] virtual auto layout(int width) const -> std::vector<TextLine> = 0;

  private:
    std::string _id;
    RenderCache _cache;
    int _layoutCount = 0;
};

} // namespace tailview::tui
