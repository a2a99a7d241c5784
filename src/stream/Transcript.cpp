// SPDX-License-Identifier: Apache-2.0
#include <stream/Transcript.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tui/MessageItems.hpp>

#include <format>
#include <type_traits>
#include <variant>

namespace tailview::stream
{

using tui::ToolStatus;

namespace
{
    auto subagentTypeOf(nlohmann::json const& input) -> std::optional<std::string>
    {
        if (auto const* value = json::find(input, "subagent_type"); value && value->is_string())
            return value->get<std::string>();
        return std::nullopt;
    }

    auto makeSubagent(ToolCallUpdate const& update, std::string subagentType) -> std::unique_ptr<tui::SubagentItem>
    {
        return std::make_unique<tui::SubagentItem>(update.toolCallId,
                                                   std::move(subagentType),
                                                   json::getStringOr(update.input, "prompt", ""),
                                                   tui::toolStatusFromString(update.status),
                                                   update.sessionId);
    }

    auto isPendingOrRunning(ToolStatus status) noexcept -> bool
    {
        return status == ToolStatus::Pending || status == ToolStatus::Running;
    }
} // namespace

Transcript::Transcript(tui::ScrollList& list): _list(list)
{
}

void Transcript::apply(AgentEvent const& event)
{
    std::visit(
        [this](auto const& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TextDelta>)
                appendText(e.delta);
            else if constexpr (std::is_same_v<T, ThinkingDelta>)
                appendThinking(e.delta);
            else if constexpr (std::is_same_v<T, UserMessage>)
                appendUserMessage(e.text);
            else if constexpr (std::is_same_v<T, ToolCallUpdate>)
                applyToolCall(e);
            else if constexpr (std::is_same_v<T, ToolError>)
                markToolError(e.toolCallId, e.message);
            else if constexpr (std::is_same_v<T, ToolCanceled>)
                markToolCanceled(e.toolCallId);
            else if constexpr (std::is_same_v<T, IterationStart>)
                addIterationDivider(e.number);
            else if constexpr (std::is_same_v<T, Finish>)
                finish(e);
            else if constexpr (std::is_same_v<T, HookStart>)
                appendHook(e);
            else if constexpr (std::is_same_v<T, HookUpdate>)
                updateHook(e);
        },
        event);
}

auto Transcript::nextId(std::string_view prefix) -> std::string
{
    return std::format("{}-{}", prefix, _sequence++);
}

auto Transcript::lastItem() -> tui::Item*
{
    return _list.empty() ? nullptr : _list.item(_list.size() - 1);
}

auto Transcript::toolItem(std::string_view toolCallId) -> tui::Item*
{
    auto const it = _toolIndex.find(toolCallId);
    if (it == _toolIndex.end() || it->second >= _list.size())
        return nullptr;
    return _list.item(it->second);
}

void Transcript::append(std::unique_ptr<tui::Item> item)
{
    _list.appendItem(std::move(item));
}

// =============================================================================
// Streaming content
// =============================================================================

void Transcript::appendText(std::string_view delta)
{
    if (auto* last = dynamic_cast<tui::TextItem*>(lastItem());
        last && last->tone() == tui::TextTone::Assistant)
    {
        last->appendText(delta);
        _list.contentChanged();
        return;
    }
    append(std::make_unique<tui::TextItem>(nextId("text"), std::string(delta)));
}

void Transcript::appendThinking(std::string_view delta)
{
    if (auto* last = dynamic_cast<tui::ThinkingItem*>(lastItem()); last && !last->finished())
    {
        last->appendText(delta);
        _list.contentChanged();
        return;
    }
    append(std::make_unique<tui::ThinkingItem>(nextId("thinking"), std::string(delta)));
}

void Transcript::appendUserMessage(std::string_view text)
{
    append(std::make_unique<tui::UserItem>(nextId("user"), std::string(text)));
}

// =============================================================================
// Tool calls
// =============================================================================

void Transcript::applyToolCall(ToolCallUpdate const& update)
{
    auto const subagentType = subagentTypeOf(update.input);
    auto* existing = toolItem(update.toolCallId);

    if (!existing)
    {
        _toolIndex[update.toolCallId] = _list.size();
        if (subagentType)
            append(makeSubagent(update, *subagentType));
        else
            append(std::make_unique<tui::ToolItem>(update.toolCallId,
                                                   update.title,
                                                   update.kind,
                                                   tui::toolStatusFromString(update.status),
                                                   update.input,
                                                   update.output));
        return;
    }

    if (auto* subagent = dynamic_cast<tui::SubagentItem*>(existing))
    {
        if (!update.status.empty())
            subagent->setStatus(tui::toolStatusFromString(update.status));
        if (!update.sessionId.empty())
            subagent->setSessionId(update.sessionId);
        _list.contentChanged();
        return;
    }

    auto* tool = dynamic_cast<tui::ToolItem*>(existing);
    if (!tool)
        return;

    // The input often arrives only with the in_progress update, so a plain
    // tool call may turn out to be a subagent later.
    if (subagentType)
    {
        log::debug("Tool call {} became a {} subagent", update.toolCallId, *subagentType);
        _list.replaceItem(_toolIndex[update.toolCallId], makeSubagent(update, *subagentType));
        return;
    }

    if (!update.status.empty())
        tool->setStatus(tui::toolStatusFromString(update.status));
    if (!update.kind.empty())
        tool->setToolKind(update.kind);
    if (update.input.is_object() && !update.input.empty())
        tool->setInput(update.input);
    if (!update.output.empty())
        tool->setOutput(update.output);
    _list.contentChanged();
}

void Transcript::markToolError(std::string_view toolCallId, std::string_view message)
{
    auto* tool = dynamic_cast<tui::ToolItem*>(toolItem(toolCallId));
    if (!tool)
    {
        log::debug("tool_error for unknown tool call {}", toolCallId);
        return;
    }
    tool->setStatus(ToolStatus::Error);
    tool->setOutput(std::string(message));
    _list.contentChanged();
}

void Transcript::markToolCanceled(std::string_view toolCallId)
{
    auto* tool = dynamic_cast<tui::ToolItem*>(toolItem(toolCallId));
    if (!tool)
    {
        log::debug("tool_canceled for unknown tool call {}", toolCallId);
        return;
    }
    tool->setStatus(ToolStatus::Canceled);
    _list.contentChanged();
}

// =============================================================================
// Run structure
// =============================================================================

void Transcript::addIterationDivider(int number)
{
    append(std::make_unique<tui::DividerItem>(nextId("divider"), number));
}

void Transcript::finish(Finish const& event)
{
    if (auto* thinking = dynamic_cast<tui::ThinkingItem*>(lastItem()))
        thinking->finish(event.duration);

    if (event.reason == "cancelled")
    {
        for (auto i = std::size_t { 0 }; i < _list.size(); ++i)
            if (auto* tool = dynamic_cast<tui::ToolItem*>(_list.item(i)); tool && isPendingOrRunning(tool->status()))
                tool->setStatus(ToolStatus::Canceled);
    }

    append(std::make_unique<tui::InfoItem>(nextId("info"), event.model, event.provider, event.duration));

    if (!event.error.empty())
        append(std::make_unique<tui::TextItem>(
            nextId("finish-error"), std::format("Error: {}", event.error), tui::TextTone::Error));
    else if (event.reason == "cancelled")
        append(std::make_unique<tui::TextItem>(nextId("finish-cancel"), "Iteration canceled", tui::TextTone::Canceled));

    _list.contentChanged();
}

// =============================================================================
// Hooks
// =============================================================================

void Transcript::appendHook(HookStart const& event)
{
    if (_hookIndex.contains(event.hookId))
    {
        log::debug("Duplicate hook start {}", event.hookId);
        return;
    }
    _hookIndex[event.hookId] = _list.size();
    append(std::make_unique<tui::HookItem>(event.hookId, event.hookType, event.command));
}

void Transcript::updateHook(HookUpdate const& event)
{
    auto const it = _hookIndex.find(event.hookId);
    auto* hook = it != _hookIndex.end() && it->second < _list.size()
                     ? dynamic_cast<tui::HookItem*>(_list.item(it->second))
                     : nullptr;
    if (!hook)
    {
        log::debug("hook_update for unknown hook {}", event.hookId);
        return;
    }
    hook->setResult(event.status == "error" ? ToolStatus::Error : ToolStatus::Success, event.output, event.duration);
    _list.contentChanged();
}

void Transcript::clear()
{
    _list.clear();
    _toolIndex.clear();
    _hookIndex.clear();
}

// =============================================================================
// Interaction
// =============================================================================

void Transcript::scrollViewport(int lines)
{
    _list.scrollBy(lines);
    _list.setAutoScroll(lines > 0 && _list.atBottom());
}

auto Transcript::clickAtRow(int row) -> ClickResult
{
    auto const index = _list.itemAtRow(row);
    if (!index)
        return {};

    auto* item = _list.item(*index);
    if (auto const* subagent = dynamic_cast<tui::SubagentItem const*>(item))
    {
        if (subagent->sessionId().empty())
            return {};
        return ClickResult { .changed = false, .sessionId = subagent->sessionId() };
    }

    if (!item->expandable())
        return {};
    item->toggleExpanded();
    _list.contentChanged();
    return ClickResult { .changed = true, .sessionId = std::nullopt };
}

} // namespace tailview::stream
