// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string_view>
#include <variant>

#include <stream/AgentEvent.hpp>

using namespace tailview;
using namespace tailview::stream;

namespace
{
template <typename T>
auto parseAs(std::string_view line) -> T
{
    auto event = parseAgentEventLine(line);
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<T>(*event));
    return std::get<T>(*event);
}

auto parseError(std::string_view line) -> Error
{
    auto event = parseAgentEventLine(line);
    REQUIRE_FALSE(event.has_value());
    return event.error();
}
} // namespace

TEST_CASE("AgentEvent: streaming deltas", "[stream][event]")
{
    CHECK(parseAs<TextDelta>(R"({"type":"text","delta":"Hello"})").delta == "Hello");
    CHECK(parseAs<ThinkingDelta>(R"({"type":"thinking","delta":"hmm"})").delta == "hmm");
    CHECK(parseAs<UserMessage>(R"({"type":"user","text":"hi there"})").text == "hi there");
    CHECK(parseAs<TextDelta>(R"({"type":"text"})").delta.empty());
}

TEST_CASE("AgentEvent: tool call", "[stream][event]")
{
    auto const update = parseAs<ToolCallUpdate>(R"({
        "type": "tool_call",
        "toolCallId": "call_1",
        "title": "bash",
        "kind": "execute",
        "status": "in_progress",
        "input": {"command": "ls -la"},
        "output": "total 0",
        "sessionId": "ses_1"
    })");

    CHECK(update.toolCallId == "call_1");
    CHECK(update.title == "bash");
    CHECK(update.kind == "execute");
    CHECK(update.status == "in_progress");
    CHECK(update.input.at("command") == "ls -la");
    CHECK(update.output == "total 0");
    CHECK(update.sessionId == "ses_1");
}

TEST_CASE("AgentEvent: tool call with only an id", "[stream][event]")
{
    auto const update = parseAs<ToolCallUpdate>(R"({"type":"tool_call","toolCallId":"c","input":[1,2]})");
    CHECK(update.toolCallId == "c");
    CHECK(update.status.empty());
    CHECK(update.input.is_null());
}

TEST_CASE("AgentEvent: tool error and cancel", "[stream][event]")
{
    auto const error = parseAs<ToolError>(R"({"type":"tool_error","toolCallId":"c1","message":"denied"})");
    CHECK(error.toolCallId == "c1");
    CHECK(error.message == "denied");

    CHECK(parseAs<ToolCanceled>(R"({"type":"tool_canceled","toolCallId":"c2"})").toolCallId == "c2");
}

TEST_CASE("AgentEvent: iteration and finish", "[stream][event]")
{
    CHECK(parseAs<IterationStart>(R"({"type":"iteration","number":4})").number == 4);

    auto const finish = parseAs<Finish>(
        R"({"type":"finish","reason":"cancelled","model":"m1","provider":"p1","durationMs":1500})");
    CHECK(finish.reason == "cancelled");
    CHECK(finish.model == "m1");
    CHECK(finish.provider == "p1");
    CHECK(finish.duration == std::chrono::milliseconds(1500));
    CHECK(finish.error.empty());

    auto const defaults = parseAs<Finish>(R"({"type":"finish"})");
    CHECK(defaults.reason == "stop");
    CHECK(defaults.duration.count() == 0);
}

TEST_CASE("AgentEvent: hook start and update", "[stream][event]")
{
    auto const start =
        parseAs<HookStart>(R"({"type":"hook","hookId":"hook-pre_tool-1","hookType":"pre_tool","command":"lint"})");
    CHECK(start.hookId == "hook-pre_tool-1");
    CHECK(start.hookType == "pre_tool");
    CHECK(start.command == "lint");

    auto const update = parseAs<HookUpdate>(
        R"({"type":"hook_update","hookId":"hook-pre_tool-1","status":"error","output":"1 problem","durationMs":250})");
    CHECK(update.hookId == "hook-pre_tool-1");
    CHECK(update.status == "error");
    CHECK(update.output == "1 problem");
    CHECK(update.duration == std::chrono::milliseconds(250));

    auto const defaults = parseAs<HookUpdate>(R"({"type":"hook_update","hookId":"h"})");
    CHECK(defaults.status == "completed");
    CHECK(defaults.output.empty());
}

TEST_CASE("AgentEvent: malformed input", "[stream][event]")
{
    SECTION("invalid JSON")
    {
        CHECK(parseError("{not json").code == ErrorCode::ProtocolError);
    }

    SECTION("not an object")
    {
        CHECK(parseError("[1,2,3]").code == ErrorCode::ProtocolError);
    }

    SECTION("missing type")
    {
        CHECK(parseError(R"({"delta":"x"})").code == ErrorCode::ProtocolError);
    }

    SECTION("unknown type")
    {
        auto const error = parseError(R"({"type":"telemetry"})");
        CHECK(error.code == ErrorCode::ProtocolError);
        CHECK(error.message.find("telemetry") != std::string::npos);
    }

    SECTION("tool events need an id")
    {
        CHECK(parseError(R"({"type":"tool_call","status":"pending"})").code == ErrorCode::ProtocolError);
        CHECK(parseError(R"({"type":"tool_error"})").code == ErrorCode::ProtocolError);
        CHECK(parseError(R"({"type":"tool_canceled","toolCallId":7})").code == ErrorCode::ProtocolError);
    }

    SECTION("hook events need an id")
    {
        CHECK(parseError(R"({"type":"hook","hookType":"stop"})").code == ErrorCode::ProtocolError);
        CHECK(parseError(R"({"type":"hook_update","status":"completed"})").code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("AgentEvent: type names", "[stream][event]")
{
    CHECK(eventTypeName(TextDelta {}) == "text");
    CHECK(eventTypeName(ThinkingDelta {}) == "thinking");
    CHECK(eventTypeName(UserMessage {}) == "user");
    CHECK(eventTypeName(ToolCallUpdate {}) == "tool_call");
    CHECK(eventTypeName(ToolError {}) == "tool_error");
    CHECK(eventTypeName(ToolCanceled {}) == "tool_canceled");
    CHECK(eventTypeName(IterationStart {}) == "iteration");
    CHECK(eventTypeName(Finish {}) == "finish");
    CHECK(eventTypeName(HookStart {}) == "hook");
    CHECK(eventTypeName(HookUpdate {}) == "hook_update");
}
