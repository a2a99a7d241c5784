// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>

namespace tailview
{

/// @brief Screen geometry of the subagent overlay.
///
/// The frame sits Margin cells inside the list area. Its content is inset by one
/// row top and bottom and two columns on either side ("│ " and " │").
/// Coordinates are 1-based, like terminal mouse reports.
struct ModalFrame
{
    static constexpr auto Margin = 2;

    int top = 1 + Margin;
    int left = 1 + Margin;
    int innerWidth = 1;
    int innerHeight = 1;

    /// @brief Frame for a screen of @p columns whose list area has @p listRows rows.
    [[nodiscard]] static auto forScreen(int columns, int listRows) -> ModalFrame;

    [[nodiscard]] auto frameWidth() const noexcept -> int { return innerWidth + 4; }
    [[nodiscard]] auto contentTop() const noexcept -> int { return top + 1; }
    [[nodiscard]] auto contentLeft() const noexcept -> int { return left + 2; }

    /// @brief Maps a screen cell to a 0-based content row.
    /// @return nullopt for cells on the border or outside the frame.
    [[nodiscard]] auto contentRowAt(int x, int y) const noexcept -> std::optional<int>;
};

} // namespace tailview
