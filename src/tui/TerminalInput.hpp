// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <vector>

#include <termios.h>

#include <tui/InputEvent.hpp>
#include <tui/VtParser.hpp>

namespace tailview::tui
{

/// @brief Raw-mode keyboard and mouse input with resize notification.
///
/// Reads from stdin when it is a terminal and from /dev/tty otherwise, so the
/// event stream can be piped in while keys still work. SIGWINCH is delivered
/// through a self-pipe that wakes poll().
class TerminalInput
{
  public:
    TerminalInput() = default;
    ~TerminalInput();

    TerminalInput(TerminalInput const&) = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;
    TerminalInput(TerminalInput&&) = delete;
    auto operator=(TerminalInput&&) -> TerminalInput& = delete;

    /// @brief Enters raw mode and enables SGR mouse reporting.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal state saved by initialize().
    void shutdown();

    /// @brief Waits up to @p timeoutMs (-1 = forever) and returns decoded events.
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<InputEvent>;

    /// @brief Async-signal-safe wake-up used by the SIGWINCH handler.
    void notifyResize() noexcept;

  private:
    VtParser _parser;
    int _fd = -1;
    bool _ownsFd = false;
    struct termios _savedTermios {};
    bool _rawMode = false;
    std::array<int, 2> _resizePipe = { -1, -1 };
};

} // namespace tailview::tui
