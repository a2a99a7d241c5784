// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/AgentEvent.hpp>
#include <tui/ScrollList.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tailview::stream
{

/// @brief Result of clicking a transcript row.
struct ClickResult
{
    bool changed = false;                 ///< An item was expanded or collapsed.
    std::optional<std::string> sessionId; ///< A subagent asked to be opened.
};

/// @brief Producer side of a ScrollList: turns agent events into items.
///
/// Streaming deltas are merged into the trailing item when it has the matching
/// kind, tool calls are tracked by their id so later updates mutate the same
/// item in place. Must only be used on the UI thread.
class Transcript
{
  public:
    explicit Transcript(tui::ScrollList& list);

    /// @brief Dispatches a decoded event to the matching operation below.
    void apply(AgentEvent const& event);

    void appendText(std::string_view delta);
    void appendThinking(std::string_view delta);
    void appendUserMessage(std::string_view text);
    void applyToolCall(ToolCallUpdate const& update);
    void markToolError(std::string_view toolCallId, std::string_view message);
    void markToolCanceled(std::string_view toolCallId);
    void addIterationDivider(int number);

    /// @brief Appends a running hook; a repeated id is ignored.
    void appendHook(HookStart const& event);

    /// @brief Records a hook's outcome; an unknown id is ignored.
    void updateHook(HookUpdate const& event);

    void finish(Finish const& event);

    /// @brief Removes every item and forgets all tool and hook ids.
    void clear();

    /// @brief Scrolls by @p lines; auto-scroll stays on only when scrolling
    /// down ends at the bottom.
    void scrollViewport(int lines);

    /// @brief Handles a click on viewport row @p row (0-based).
    [[nodiscard]] auto clickAtRow(int row) -> ClickResult;

    [[nodiscard]] auto list() noexcept -> tui::ScrollList& { return _list; }

  private:
    [[nodiscard]] auto nextId(std::string_view prefix) -> std::string;
    [[nodiscard]] auto lastItem() -> tui::Item*;
    [[nodiscard]] auto toolItem(std::string_view toolCallId) -> tui::Item*;
    void append(std::unique_ptr<tui::Item> item);

    tui::ScrollList& _list;
    std::map<std::string, std::size_t, std::less<>> _toolIndex;
    std::map<std::string, std::size_t, std::less<>> _hookIndex;
    std::size_t _sequence = 0;
};

} // namespace tailview::stream
