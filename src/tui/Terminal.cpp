// SPDX-License-Identifier: Apache-2.0
#include <csignal>

#include <tui/Terminal.hpp>

namespace tailview::tui
{

namespace
{
    TerminalInput* gActiveInput = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};     // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void onSigwinch(int /*sig*/)
    {
        if (gActiveInput != nullptr)
            gActiveInput->notifyResize();
    }
} // namespace

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (auto result = _output.initialize(); !result)
        return result;
    if (auto result = _input.initialize(); !result)
        return result;

    gActiveInput = &_input;
    struct sigaction sa {};
    sa.sa_handler = onSigwinch;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    _output.enterAltScreen();
    _output.hideCursor();
    _output.clearScreen();
    _output.flush();

    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gActiveInput = nullptr;

    _output.showCursor();
    _output.leaveAltScreen();
    _output.flush();

    _input.shutdown();
    _initialized = false;
}

auto Terminal::output() noexcept -> TerminalOutput&
{
    return _output;
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    return _input.poll(timeoutMs);
}

auto Terminal::columns() const noexcept -> int
{
    return _output.columns();
}

auto Terminal::rows() const noexcept -> int
{
    return _output.rows();
}

} // namespace tailview::tui
