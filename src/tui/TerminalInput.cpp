// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <core/Log.hpp>
#include <tui/TerminalInput.hpp>

namespace tailview::tui
{

namespace
{
    // Basic press/release tracking plus SGR extended coordinates.
    constexpr auto EnableMouse = std::string_view { "\033[?1000h\033[?1006h" };
    constexpr auto DisableMouse = std::string_view { "\033[?1006l\033[?1000l" };

    void writeControl(std::string_view sequence)
    {
        static_cast<void>(::write(STDOUT_FILENO, sequence.data(), sequence.size()));
    }
} // namespace

TerminalInput::~TerminalInput()
{
    shutdown();
}

auto TerminalInput::initialize() -> VoidResult
{
    if (::isatty(STDIN_FILENO) != 0)
    {
        _fd = STDIN_FILENO;
    }
    else
    {
        _fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
        if (_fd < 0)
            return makeError(ErrorCode::TerminalError,
                             std::format("No controlling terminal for keyboard input: {}", std::strerror(errno)));
        _ownsFd = true;
        log::debug("stdin is not a terminal, reading keys from /dev/tty");
    }

    if (::pipe(_resizePipe.data()) == -1)
        return makeError(ErrorCode::IoError, "Failed to create resize notification pipe");
    for (auto const fd: _resizePipe)
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    if (::tcgetattr(_fd, &_savedTermios) != 0)
        return makeError(ErrorCode::TerminalError, std::format("tcgetattr failed: {}", std::strerror(errno)));

    auto raw = _savedTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(_fd, TCSAFLUSH, &raw) != 0)
        return makeError(ErrorCode::TerminalError, std::format("tcsetattr failed: {}", std::strerror(errno)));
    _rawMode = true;

    writeControl(EnableMouse);
    return {};
}

void TerminalInput::shutdown()
{
    if (_rawMode)
    {
        writeControl(DisableMouse);
        ::tcsetattr(_fd, TCSAFLUSH, &_savedTermios);
        _rawMode = false;
    }

    for (auto& fd: _resizePipe)
    {
        if (fd != -1)
            ::close(fd);
        fd = -1;
    }

    if (_ownsFd)
    {
        ::close(_fd);
        _ownsFd = false;
    }
    _fd = -1;
}

auto TerminalInput::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<pollfd, 2> {};
    fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _resizePipe[0], .events = POLLIN, .revents = 0 };

    auto const ready = ::poll(fds.data(), fds.size(), timeoutMs);
    if (ready == 0)
        return _parser.timeout();
    if (ready < 0)
        return {};

    auto events = std::vector<InputEvent> {};

    if ((fds[1].revents & POLLIN) != 0)
    {
        auto drain = char {};
        while (::read(_resizePipe[0], &drain, 1) > 0)
            ;

        auto ws = winsize {};
        if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0)
            events.emplace_back(ResizeEvent { .columns = ws.ws_col, .rows = ws.ws_row });
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 512> {};
        auto const n = ::read(_fd, buf.data(), buf.size());
        if (n > 0)
        {
            auto parsed = _parser.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
            events.insert(events.end(), parsed.begin(), parsed.end());
        }
    }

    return events;
}

void TerminalInput::notifyResize() noexcept
{
    if (_resizePipe[1] == -1)
        return;
    auto const byte = char { 1 };
    static_cast<void>(::write(_resizePipe[1], &byte, 1));
}

} // namespace tailview::tui
