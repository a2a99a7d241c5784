// SPDX-License-Identifier: Apache-2.0
#include <tailview/ModalFrame.hpp>

#include <algorithm>

namespace tailview
{

auto ModalFrame::forScreen(int columns, int listRows) -> ModalFrame
{
    return ModalFrame {
        .top = 1 + Margin,
        .left = 1 + Margin,
        .innerWidth = std::max(columns - 2 * Margin - 4, 1),
        .innerHeight = std::max(listRows - 2 * Margin - 2, 1),
    };
}

auto ModalFrame::contentRowAt(int x, int y) const noexcept -> std::optional<int>
{
    if (y < contentTop() || y >= contentTop() + innerHeight)
        return std::nullopt;
    if (x < contentLeft() || x >= contentLeft() + innerWidth)
        return std::nullopt;
    return y - contentTop();
}

} // namespace tailview
