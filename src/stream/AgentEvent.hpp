// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace tailview::stream
{

/// @brief A chunk of assistant text.
struct TextDelta
{
    std::string delta;
};

/// @brief A chunk of model reasoning.
struct ThinkingDelta
{
    std::string delta;
};

/// @brief A message typed by the user.
struct UserMessage
{
    std::string text;
};

/// @brief Creation of, or an update to, a tool call identified by toolCallId.
///
/// Empty strings and a null input mean "unchanged" when updating.
struct ToolCallUpdate
{
    std::string toolCallId;
    std::string title;
    std::string kind;
    std::string status;
    nlohmann::json input;
    std::string output;
    std::string sessionId;
};

struct ToolError
{
    std::string toolCallId;
    std::string message;
};

struct ToolCanceled
{
    std::string toolCallId;
};

/// @brief Start of an agent loop iteration.
struct IterationStart
{
    int number = 0;
};

/// @brief End of a run.
struct Finish
{
    std::string reason; ///< "stop", "error", "cancelled", ...
    std::string error;
    std::string model;
    std::string provider;
    std::chrono::milliseconds duration {};
};

/// @brief A lifecycle hook started running.
struct HookStart
{
    std::string hookId;
    std::string hookType; ///< e.g. "pre_tool", "post_tool", "stop"
    std::string command;
};

/// @brief A hook finished.
struct HookUpdate
{
    std::string hookId;
    std::string status; ///< "completed" or "error"
    std::string output;
    std::chrono::milliseconds duration {};
};

/// @brief One decoded line of an agent event stream.
using AgentEvent = std::variant<TextDelta,
                                ThinkingDelta,
                                UserMessage,
                                ToolCallUpdate,
                                ToolError,
                                ToolCanceled,
                                IterationStart,
                                Finish,
                                HookStart,
                                HookUpdate>;

/// @brief Decodes an event object by its "type" field.
[[nodiscard]] auto parseAgentEvent(nlohmann::json const& object) -> Result<AgentEvent>;

/// @brief Parses one JSON Lines record.
[[nodiscard]] auto parseAgentEventLine(std::string_view line) -> Result<AgentEvent>;

/// @brief Returns the wire name of the event's type.
[[nodiscard]] auto eventTypeName(AgentEvent const& event) noexcept -> std::string_view;

} // namespace tailview::stream
