// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <tui/InputEvent.hpp>
#include <tui/TerminalInput.hpp>
#include <tui/TerminalOutput.hpp>

namespace tailview::tui
{

/// @brief Owns terminal input and output for a full-screen session.
///
/// initialize() switches to the alternate screen, hides the cursor, enters raw
/// mode and installs the SIGWINCH handler; shutdown() (or the destructor)
/// undoes all of it in reverse order. Only one instance may be active.
class Terminal
{
  public:
    Terminal() = default;
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    [[nodiscard]] auto initialize() -> VoidResult;
    void shutdown();

    [[nodiscard]] auto output() noexcept -> TerminalOutput&;

    /// @brief Polls for input events; see TerminalInput::poll().
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<InputEvent>;

    [[nodiscard]] auto columns() const noexcept -> int;
    [[nodiscard]] auto rows() const noexcept -> int;

  private:
    TerminalInput _input;
    TerminalOutput _output;
    bool _initialized = false;
};

} // namespace tailview::tui
