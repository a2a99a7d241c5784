// SPDX-License-Identifier: Apache-2.0
#include <tui/Item.hpp>

#include <algorithm>

namespace tailview::tui
{

auto itemKindName(ItemKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
        case ItemKind::Text: return "text";
        case ItemKind::User: return "user";
        case ItemKind::Thinking: return "thinking";
        case ItemKind::Tool: return "tool";
        case ItemKind::Subagent: return "subagent";
        case ItemKind::Hook: return "hook";
        case ItemKind::Info: return "info";
        case ItemKind::Divider: return "divider";
    }
    return "unknown";
}

Item::Item(std::string id): _id(std::move(id))
{
}

auto Item::render(int width) -> std::vector<TextLine> const&
{
    width = std::max(width, 0);
    if (_cache.hit(width))
        return _cache.lines;

    _cache.store(width, layout(width));
    ++_layoutCount;
    return _cache.lines;
}

} // namespace tailview::tui
