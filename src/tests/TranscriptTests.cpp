// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>
#include <string>

#include <stream/Transcript.hpp>
#include <tui/MessageItems.hpp>
#include <tui/ScrollList.hpp>

using namespace tailview::stream;
using namespace tailview::tui;
using namespace std::chrono_literals;

namespace
{
/// @brief A list plus the transcript feeding it.
struct Fixture
{
    ScrollList list { 60, 20 };
    Transcript transcript { list };
};

template <typename T>
auto itemAs(ScrollList& list, std::size_t index) -> T&
{
    REQUIRE(index < list.size());
    auto* item = dynamic_cast<T*>(list.item(index));
    REQUIRE(item != nullptr);
    return *item;
}

auto toolCall(std::string id, std::string status) -> ToolCallUpdate
{
    return ToolCallUpdate {
        .toolCallId = std::move(id), .title = "bash", .kind = "execute", .status = std::move(status) };
}
} // namespace

// =============================================================================
// Streaming merges
// =============================================================================

TEST_CASE("Transcript: text deltas merge into the trailing text item", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.appendText("Hello ");
    f.transcript.appendText("world");

    REQUIRE(f.list.size() == 1);
    CHECK(itemAs<TextItem>(f.list, 0).content() == "Hello world");

    f.transcript.appendUserMessage("thanks");
    f.transcript.appendText("You're welcome");
    REQUIRE(f.list.size() == 3);
    CHECK(itemAs<UserItem>(f.list, 1).content() == "thanks");
    CHECK(itemAs<TextItem>(f.list, 2).content() == "You're welcome");
}

TEST_CASE("Transcript: item ids are unique", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.appendText("a");
    f.transcript.appendUserMessage("b");
    f.transcript.appendText("c");
    CHECK(f.list.item(0)->id() != f.list.item(2)->id());
    CHECK(f.list.indexOf(f.list.item(1)->id()) == 1u);
}

TEST_CASE("Transcript: thinking deltas merge until the thought is finished", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.appendThinking("let me ");
    f.transcript.appendThinking("see");
    REQUIRE(f.list.size() == 1);
    CHECK(itemAs<ThinkingItem>(f.list, 0).content() == "let me see");

    f.transcript.finish(Finish { .reason = "stop", .model = "m", .duration = 1200ms });
    CHECK(itemAs<ThinkingItem>(f.list, 0).finished());
    REQUIRE(f.list.size() == 2);
    CHECK(f.list.item(1)->kind() == ItemKind::Info);

    f.transcript.appendThinking("again");
    REQUIRE(f.list.size() == 3);
    CHECK(itemAs<ThinkingItem>(f.list, 2).content() == "again");
}

TEST_CASE("Transcript: text never merges into a finish message", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.finish(Finish { .reason = "error", .error = "boom" });
    REQUIRE(f.list.size() == 2);
    CHECK(itemAs<TextItem>(f.list, 1).tone() == TextTone::Error);
    CHECK(itemAs<TextItem>(f.list, 1).content() == "Error: boom");

    f.transcript.appendText("next");
    REQUIRE(f.list.size() == 3);
    CHECK(itemAs<TextItem>(f.list, 2).content() == "next");
}

// =============================================================================
// Tool calls
// =============================================================================

TEST_CASE("Transcript: tool call updates mutate the same item", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.applyToolCall(toolCall("c1", "pending"));
    f.transcript.appendText("meanwhile");

    auto update = ToolCallUpdate { .toolCallId = "c1", .status = "completed", .output = "done" };
    update.input = nlohmann::json { { "command", "ls" } };
    f.transcript.applyToolCall(update);

    REQUIRE(f.list.size() == 2);
    auto& tool = itemAs<ToolItem>(f.list, 0);
    CHECK(tool.name() == "bash");
    CHECK(tool.toolKind() == "execute");
    CHECK(tool.status() == ToolStatus::Success);
    CHECK(tool.output() == "done");
    CHECK(tool.input().at("command") == "ls");
}

TEST_CASE("Transcript: empty update fields leave the tool unchanged", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.applyToolCall(toolCall("c1", "in_progress"));
    f.transcript.applyToolCall(ToolCallUpdate { .toolCallId = "c1" });

    auto& tool = itemAs<ToolItem>(f.list, 0);
    CHECK(tool.status() == ToolStatus::Running);
    CHECK(tool.toolKind() == "execute");
}

TEST_CASE("Transcript: subagent calls become subagent boxes", "[stream][transcript]")
{
    auto f = Fixture {};

    SECTION("known on creation")
    {
        auto update = toolCall("t1", "pending");
        update.input = nlohmann::json { { "subagent_type", "explore" }, { "prompt", "map the repo" } };
        f.transcript.applyToolCall(update);

        auto& subagent = itemAs<SubagentItem>(f.list, 0);
        CHECK(subagent.subagentType() == "explore");
        CHECK(subagent.description() == "map the repo");
        CHECK(subagent.status() == ToolStatus::Pending);
    }

    SECTION("revealed by a later update")
    {
        f.transcript.applyToolCall(toolCall("t1", "pending"));
        REQUIRE(f.list.item(0)->kind() == ItemKind::Tool);

        auto update = ToolCallUpdate { .toolCallId = "t1", .status = "in_progress" };
        update.input = nlohmann::json { { "subagent_type", "general" }, { "prompt", "fix it" } };
        f.transcript.applyToolCall(update);

        REQUIRE(f.list.size() == 1);
        auto& subagent = itemAs<SubagentItem>(f.list, 0);
        CHECK(subagent.id() == "t1");
        CHECK(subagent.status() == ToolStatus::Running);

        f.transcript.applyToolCall(
            ToolCallUpdate { .toolCallId = "t1", .status = "completed", .sessionId = "ses_7" });
        CHECK(subagent.status() == ToolStatus::Success);
        CHECK(subagent.sessionId() == "ses_7");
    }
}

TEST_CASE("Transcript: tool errors and cancellations", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.applyToolCall(toolCall("c1", "in_progress"));
    f.transcript.applyToolCall(toolCall("c2", "in_progress"));

    f.transcript.markToolError("c1", "exit status 2");
    f.transcript.markToolCanceled("c2");
    f.transcript.markToolError("unknown", "ignored");

    REQUIRE(f.list.size() == 2);
    CHECK(itemAs<ToolItem>(f.list, 0).status() == ToolStatus::Error);
    CHECK(itemAs<ToolItem>(f.list, 0).output() == "exit status 2");
    CHECK(itemAs<ToolItem>(f.list, 1).status() == ToolStatus::Canceled);
}

// =============================================================================
// Run structure
// =============================================================================

TEST_CASE("Transcript: iteration dividers", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.addIterationDivider(3);
    CHECK(itemAs<DividerItem>(f.list, 0).iteration() == 3);
}

TEST_CASE("Transcript: canceled runs cancel unfinished tools", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.applyToolCall(toolCall("c1", "pending"));
    f.transcript.applyToolCall(toolCall("c2", "in_progress"));
    f.transcript.applyToolCall(toolCall("c3", "completed"));

    f.transcript.finish(Finish { .reason = "cancelled", .duration = 2s });

    CHECK(itemAs<ToolItem>(f.list, 0).status() == ToolStatus::Canceled);
    CHECK(itemAs<ToolItem>(f.list, 1).status() == ToolStatus::Canceled);
    CHECK(itemAs<ToolItem>(f.list, 2).status() == ToolStatus::Success);

    REQUIRE(f.list.size() == 5);
    CHECK(f.list.item(3)->kind() == ItemKind::Info);
    CHECK(itemAs<TextItem>(f.list, 4).content() == "Iteration canceled");
    CHECK(itemAs<TextItem>(f.list, 4).tone() == TextTone::Canceled);
}

TEST_CASE("Transcript: a normal finish only adds the summary", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.appendText("done");
    f.transcript.finish(Finish { .reason = "stop", .model = "m", .provider = "p", .duration = 500ms });
    REQUIRE(f.list.size() == 2);
    CHECK(f.list.item(1)->kind() == ItemKind::Info);
}

TEST_CASE("Transcript: clear forgets tool ids", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.applyToolCall(toolCall("c1", "completed"));
    f.transcript.clear();
    CHECK(f.list.empty());

    f.transcript.applyToolCall(toolCall("c1", "pending"));
    REQUIRE(f.list.size() == 1);
    CHECK(itemAs<ToolItem>(f.list, 0).status() == ToolStatus::Pending);
}

TEST_CASE("Transcript: hook results update the item started under the same id", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.appendHook(HookStart { .hookId = "hook-pre_tool-1", .hookType = "pre_tool", .command = "lint" });
    f.transcript.appendText("checking");
    f.transcript.appendHook(HookStart { .hookId = "hook-pre_tool-1", .hookType = "pre_tool", .command = "again" });
    REQUIRE(f.list.size() == 2);
    CHECK(itemAs<HookItem>(f.list, 0).status() == ToolStatus::Running);

    f.transcript.updateHook(HookUpdate {
        .hookId = "hook-pre_tool-1", .status = "error", .output = "1 problem", .duration = 40ms });
    auto const& hook = itemAs<HookItem>(f.list, 0);
    CHECK(hook.status() == ToolStatus::Error);
    CHECK(hook.output() == "1 problem");
    CHECK(hook.command() == "lint");

    f.transcript.updateHook(HookUpdate { .hookId = "hook-stop-9", .status = "completed" });
    CHECK(f.list.size() == 2);

    f.transcript.clear();
    f.transcript.updateHook(HookUpdate { .hookId = "hook-pre_tool-1", .status = "completed" });
    CHECK(f.list.empty());
}

TEST_CASE("Transcript: apply dispatches decoded events", "[stream][transcript]")
{
    auto f = Fixture {};
    for (auto const* line: {
             R"({"type":"user","text":"hi"})",
             R"({"type":"iteration","number":1})",
             R"({"type":"text","delta":"Hel"})",
             R"({"type":"text","delta":"lo"})",
             R"({"type":"tool_call","toolCallId":"c1","title":"read","status":"pending"})",
             R"({"type":"tool_canceled","toolCallId":"c1"})",
             R"({"type":"hook","hookId":"h1","hookType":"stop","command":"notify"})",
             R"({"type":"hook_update","hookId":"h1","status":"completed","output":"sent"})",
             R"({"type":"finish","reason":"stop","durationMs":10})",
         })
    {
        auto event = parseAgentEventLine(line);
        REQUIRE(event.has_value());
        f.transcript.apply(*event);
    }

    REQUIRE(f.list.size() == 6);
    CHECK(f.list.item(0)->kind() == ItemKind::User);
    CHECK(f.list.item(1)->kind() == ItemKind::Divider);
    CHECK(itemAs<TextItem>(f.list, 2).content() == "Hello");
    CHECK(itemAs<ToolItem>(f.list, 3).status() == ToolStatus::Canceled);
    CHECK(itemAs<HookItem>(f.list, 4).status() == ToolStatus::Success);
    CHECK(itemAs<HookItem>(f.list, 4).output() == "sent");
    CHECK(f.list.item(5)->kind() == ItemKind::Info);
}

// =============================================================================
// Interaction
// =============================================================================

TEST_CASE("Transcript: manual scrolling controls auto-scroll", "[stream][transcript]")
{
    auto f = Fixture {};
    for (auto i = 0; i < 40; ++i)
        f.transcript.appendUserMessage(std::format("message {}", i));
    REQUIRE(f.list.atBottom());

    f.transcript.scrollViewport(-3);
    CHECK_FALSE(f.list.autoScroll());
    CHECK_FALSE(f.list.atBottom());

    f.transcript.appendText("new");
    CHECK_FALSE(f.list.atBottom());

    f.transcript.scrollViewport(1);
    CHECK_FALSE(f.list.autoScroll());

    f.transcript.scrollViewport(1000);
    CHECK(f.list.atBottom());
    CHECK(f.list.autoScroll());

    f.transcript.appendText(" more");
    CHECK(f.list.atBottom());
}

TEST_CASE("Transcript: clicking toggles expandable items", "[stream][transcript]")
{
    auto f = Fixture {};
    auto update = toolCall("c1", "completed");
    update.output = "1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n11\n12";
    f.transcript.applyToolCall(update);
    REQUIRE(f.list.totalLineCount() == 13);

    auto result = f.transcript.clickAtRow(0);
    CHECK(result.changed);
    CHECK_FALSE(result.sessionId.has_value());
    CHECK(f.list.item(0)->expanded());
    CHECK(f.list.totalLineCount() == 14);

    result = f.transcript.clickAtRow(19);
    CHECK_FALSE(result.changed);
}

TEST_CASE("Transcript: clicking a subagent with a session opens it", "[stream][transcript]")
{
    auto f = Fixture {};
    f.transcript.addIterationDivider(1);

    auto update = toolCall("t1", "completed");
    update.input = nlohmann::json { { "subagent_type", "explore" }, { "prompt", "look" } };
    update.sessionId = "ses_42";
    f.transcript.applyToolCall(update);

    CHECK_FALSE(f.transcript.clickAtRow(0).changed);
    CHECK_FALSE(f.transcript.clickAtRow(1).sessionId.has_value());

    auto const result = f.transcript.clickAtRow(3);
    CHECK_FALSE(result.changed);
    CHECK(result.sessionId == "ses_42");
}
