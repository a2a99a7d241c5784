// SPDX-License-Identifier: Apache-2.0
#include <stream/AgentEvent.hpp>

#include <core/JsonUtils.hpp>

#include <format>

namespace tailview::stream
{

namespace
{
    auto parseToolCall(nlohmann::json const& object) -> Result<AgentEvent>
    {
        auto id = json::getString(object, "toolCallId");
        if (!id)
            return std::unexpected(id.error());

        auto update = ToolCallUpdate {
            .toolCallId = std::move(*id),
            .title = json::getStringOr(object, "title", ""),
            .kind = json::getStringOr(object, "kind", ""),
            .status = json::getStringOr(object, "status", ""),
            .input = nullptr,
            .output = json::getStringOr(object, "output", ""),
            .sessionId = json::getStringOr(object, "sessionId", ""),
        };
        if (auto const* input = json::find(object, "input"); input && input->is_object())
            update.input = *input;
        return update;
    }

    auto parseFinish(nlohmann::json const& object) -> AgentEvent
    {
        return Finish {
            .reason = json::getStringOr(object, "reason", "stop"),
            .error = json::getStringOr(object, "error", ""),
            .model = json::getStringOr(object, "model", ""),
            .provider = json::getStringOr(object, "provider", ""),
            .duration = std::chrono::milliseconds(json::getInt64Or(object, "durationMs", 0)),
        };
    }

    auto parseHook(nlohmann::json const& object) -> Result<AgentEvent>
    {
        auto id = json::getString(object, "hookId");
        if (!id)
            return std::unexpected(id.error());
        return HookStart {
            .hookId = std::move(*id),
            .hookType = json::getStringOr(object, "hookType", ""),
            .command = json::getStringOr(object, "command", ""),
        };
    }

    auto parseHookUpdate(nlohmann::json const& object) -> Result<AgentEvent>
    {
        auto id = json::getString(object, "hookId");
        if (!id)
            return std::unexpected(id.error());
        return HookUpdate {
            .hookId = std::move(*id),
            .status = json::getStringOr(object, "status", "completed"),
            .output = json::getStringOr(object, "output", ""),
            .duration = std::chrono::milliseconds(json::getInt64Or(object, "durationMs", 0)),
        };
    }
} // namespace

auto parseAgentEvent(nlohmann::json const& object) -> Result<AgentEvent>
{
    if (!object.is_object())
        return makeError(ErrorCode::ProtocolError, "Event is not a JSON object");

    auto type = json::getString(object, "type");
    if (!type)
        return makeError(ErrorCode::ProtocolError, "Event has no 'type' field");

    if (*type == "text")
        return TextDelta { .delta = json::getStringOr(object, "delta", "") };
    if (*type == "thinking")
        return ThinkingDelta { .delta = json::getStringOr(object, "delta", "") };
    if (*type == "user")
        return UserMessage { .text = json::getStringOr(object, "text", "") };
    if (*type == "tool_call")
        return parseToolCall(object);
    if (*type == "tool_error")
    {
        auto id = json::getString(object, "toolCallId");
        if (!id)
            return std::unexpected(id.error());
        return ToolError { .toolCallId = std::move(*id), .message = json::getStringOr(object, "message", "") };
    }
    if (*type == "tool_canceled")
    {
        auto id = json::getString(object, "toolCallId");
        if (!id)
            return std::unexpected(id.error());
        return ToolCanceled { .toolCallId = std::move(*id) };
    }
    if (*type == "iteration")
        return IterationStart { .number = json::getIntOr(object, "number", 0) };
    if (*type == "finish")
        return parseFinish(object);
    if (*type == "hook")
        return parseHook(object);
    if (*type == "hook_update")
        return parseHookUpdate(object);

    return makeError(ErrorCode::ProtocolError, std::format("Unknown event type '{}'", *type));
}

auto parseAgentEventLine(std::string_view line) -> Result<AgentEvent>
{
    auto object = json::parse(line);
    if (!object)
        return std::unexpected(object.error());
    return parseAgentEvent(*object);
}

auto eventTypeName(AgentEvent const& event) noexcept -> std::string_view
{
    constexpr std::string_view Names[] = {
        "text",     "thinking", "user",   "tool_call", "tool_error",
        "tool_canceled", "iteration", "finish", "hook", "hook_update",
    };
    return Names[event.index()];
}

} // namespace tailview::stream
