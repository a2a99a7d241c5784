// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Text.hpp>

#include <vector>

namespace tailview::tui
{

/// @brief Memoized layout of one item, keyed by width only.
///
/// When valid, `lines` were laid out for exactly `width` columns and height()
/// equals their count. invalidate() keeps the previous lines (and their width
/// tag) around but never serves them again.
struct RenderCache
{
    int width = 0;
    std::vector<TextLine> lines;
    bool valid = false;

    /// @brief True if the cache can answer a render request at @p requestedWidth.
    [[nodiscard]] auto hit(int requestedWidth) const noexcept -> bool
    {
        return valid && width == requestedWidth;
    }

    /// @brief Number of cached rows, or 0 ("unknown") when invalid.
    [[nodiscard]] auto height() const noexcept -> int
    {
        return valid ? static_cast<int>(lines.size()) : 0;
    }

    void store(int newWidth, std::vector<TextLine> newLines)
    {
        width = newWidth;
        lines = std::move(newLines);
        valid = true;
    }

    void invalidate() noexcept { valid = false; }
};

} // namespace tailview::tui
