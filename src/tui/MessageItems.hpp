// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/Item.hpp>

namespace tailview::tui
{

/// @brief Execution status of a tool or subagent call.
enum class ToolStatus : std::uint8_t
{
    Pending,
    Running,
    Success,
    Error,
    Canceled,
};

/// @brief Maps wire status strings to ToolStatus.
///
/// "pending", "in_progress", "completed", "error", "canceled"/"cancelled";
/// anything else is Pending.
[[nodiscard]] auto toolStatusFromString(std::string_view status) noexcept -> ToolStatus;

/// @brief Formats a duration: "345ms" below a second, "1.2s" below a minute, else "2m30s".
[[nodiscard]] auto formatDuration(std::chrono::milliseconds duration) -> std::string;

/// @brief Formats tool input for a one-line header.
///
/// The primary parameter (`command`, else `filePath`) comes first as a bare
/// value, the rest follow as "(key=value, ...)". Cut to @p maxWidth with "...".
[[nodiscard]] auto formatToolParams(nlohmann::json const& input, int maxWidth) -> std::string;

/// @brief Colouring of a text item.
enum class TextTone : std::uint8_t
{
    Assistant,
    Error,
    Canceled,
};

/// @brief Assistant markdown, wrapped to at most 120 columns behind a left border.
///
/// Error and canceled tones are shown as plain wrapped text.
class TextItem final: public Item
{
  public:
    TextItem(std::string id, std::string content, TextTone tone = TextTone::Assistant);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Text; }
    [[nodiscard]] auto content() const noexcept -> std::string const& { return _content; }
    [[nodiscard]] auto tone() const noexcept -> TextTone { return _tone; }

    /// @brief Appends a streamed delta and invalidates.
    void appendText(std::string_view delta);

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _content;
    TextTone _tone;
};

/// @brief A user message, right-aligned with a border on its right edge.
class UserItem final: public Item
{
  public:
    UserItem(std::string id, std::string content);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::User; }
    [[nodiscard]] auto content() const noexcept -> std::string const& { return _content; }

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _content;
};

/// @brief Model reasoning; collapsed to its last 10 lines until expanded.
class ThinkingItem final: public Item
{
  public:
    static constexpr auto CollapsedLines = 10;

    ThinkingItem(std::string id, std::string content);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Thinking; }
    [[nodiscard]] auto content() const noexcept -> std::string const& { return _content; }
    [[nodiscard]] auto finished() const noexcept -> bool { return _finished; }

    void appendText(std::string_view delta);

    /// @brief Marks reasoning as complete; a positive duration adds a footer.
    void finish(std::chrono::milliseconds duration);

    [[nodiscard]] auto expandable() const noexcept -> bool override { return true; }
    [[nodiscard]] auto expanded() const noexcept -> bool override { return !_collapsed; }
    void toggleExpanded() override;

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _content;
    bool _collapsed = true;
    bool _finished = false;
    std::chrono::milliseconds _duration {};
};

/// @brief A tool invocation: status header plus (truncated) output.
class ToolItem final: public Item
{
  public:
    static constexpr auto MaxOutputLines = 10;

    ToolItem(std::string id, std::string name, std::string toolKind, ToolStatus status, nlohmann::json input,
             std::string output);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Tool; }
    [[nodiscard]] auto name() const noexcept -> std::string const& { return _name; }
    [[nodiscard]] auto toolKind() const noexcept -> std::string const& { return _toolKind; }
    [[nodiscard]] auto status() const noexcept -> ToolStatus { return _status; }
    [[nodiscard]] auto input() const noexcept -> nlohmann::json const& { return _input; }
    [[nodiscard]] auto output() const noexcept -> std::string const& { return _output; }

    void setStatus(ToolStatus status);
    void setToolKind(std::string toolKind);
    void setInput(nlohmann::json input);
    void setOutput(std::string output);

    [[nodiscard]] auto expandable() const noexcept -> bool override { return true; }
    [[nodiscard]] auto expanded() const noexcept -> bool override { return _expanded; }
    void toggleExpanded() override;

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _name;
    std::string _toolKind;
    ToolStatus _status;
    nlohmann::json _input;
    std::string _output;
    bool _expanded = false;
};

/// @brief A lifecycle hook run by the agent: a header while running, then its output.
///
/// Starts as Running; setResult() records the outcome. Output is cut like tool
/// output unless expanded or failed.
class HookItem final: public Item
{
  public:
    HookItem(std::string id, std::string hookType, std::string command);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Hook; }
    [[nodiscard]] auto hookType() const noexcept -> std::string const& { return _hookType; }
    [[nodiscard]] auto command() const noexcept -> std::string const& { return _command; }
    [[nodiscard]] auto status() const noexcept -> ToolStatus { return _status; }
    [[nodiscard]] auto output() const noexcept -> std::string const& { return _output; }

    void setResult(ToolStatus status, std::string output, std::chrono::milliseconds duration);

    [[nodiscard]] auto expandable() const noexcept -> bool override { return true; }
    [[nodiscard]] auto expanded() const noexcept -> bool override { return _expanded; }
    void toggleExpanded() override;

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _hookType;
    std::string _command;
    ToolStatus _status = ToolStatus::Running;
    std::string _output;
    std::chrono::milliseconds _duration {};
    bool _expanded = false;
};

/// @brief A delegated subagent task, drawn as a box.
class SubagentItem final: public Item
{
  public:
    SubagentItem(std::string id, std::string subagentType, std::string description, ToolStatus status,
                 std::string sessionId);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Subagent; }
    [[nodiscard]] auto subagentType() const noexcept -> std::string const& { return _subagentType; }
    [[nodiscard]] auto description() const noexcept -> std::string const& { return _description; }
    [[nodiscard]] auto status() const noexcept -> ToolStatus { return _status; }
    [[nodiscard]] auto sessionId() const noexcept -> std::string const& { return _sessionId; }

    void setStatus(ToolStatus status);
    void setSessionId(std::string sessionId);

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _subagentType;
    std::string _description;
    ToolStatus _status;
    std::string _sessionId;
};

/// @brief One-line run summary: model, provider and duration.
class InfoItem final: public Item
{
  public:
    InfoItem(std::string id, std::string model, std::string provider, std::chrono::milliseconds duration);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Info; }

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    std::string _model;
    std::string _provider;
    std::chrono::milliseconds _duration;
};

/// @brief Horizontal rule labelled with an iteration number.
class DividerItem final: public Item
{
  public:
    DividerItem(std::string id, int iteration);

    [[nodiscard]] auto kind() const noexcept -> ItemKind override { return ItemKind::Divider; }
    [[nodiscard]] auto iteration() const noexcept -> int { return _iteration; }

  protected:
    [[nodiscard]] auto layout(int width) const -> std::vector<TextLine> override;

  private:
    int _iteration;
};

} // namespace tailview::tui
