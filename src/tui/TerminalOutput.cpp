// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <algorithm>
#include <format>
#include <string_view>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace tailview::tui
{

namespace
{
    void writeAll(int fd, std::string_view data)
    {
        while (!data.empty())
        {
            auto const n = ::write(fd, data.data(), data.size());
            if (n <= 0)
                return;
            data.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    void appendColor(std::string& out, Color const& color, int base)
    {
        if (auto const* idx = std::get_if<std::uint8_t>(&color))
            out += std::format(";{};5;{}", base, *idx);
        else if (auto const* rgb = std::get_if<RgbColor>(&color))
            out += std::format(";{};2;{};{};{}", base, rgb->r, rgb->g, rgb->b);
    }
} // namespace

auto Style::isPlain() const noexcept -> bool
{
    return std::holds_alternative<std::monostate>(fg) && std::holds_alternative<std::monostate>(bg) && !bold
           && !italic && !underline && !dim && !inverse;
}

// --- SyncGuard ---

SyncGuard::SyncGuard(int fd): _fd(fd)
{
    writeAll(_fd, "\033[?2026h");
}

SyncGuard::~SyncGuard()
{
    writeAll(_fd, "\033[?2026l");
}

// --- TerminalOutput ---

TerminalOutput::TerminalOutput(int fd): _fd(fd)
{
}

auto TerminalOutput::initialize() -> VoidResult
{
    if (::isatty(_fd) == 0)
        return makeError(ErrorCode::TerminalError, std::format("File descriptor {} is not a terminal", _fd));
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (style.isPlain())
    {
        _buffer.append(text);
        return;
    }
    appendSgr(style);
    _buffer.append(text);
    _buffer += "\033[m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearLine()
{
    _buffer += "\033[2K";
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

auto TerminalOutput::syncGuard() -> SyncGuard
{
    flush();
    return SyncGuard(_fd);
}

void TerminalOutput::flush()
{
    if (_buffer.empty())
        return;
    writeAll(_fd, _buffer);
    _buffer.clear();
}

auto TerminalOutput::buffer() const noexcept -> std::string const&
{
    return _buffer;
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

void TerminalOutput::setDimensions(int columns, int rows)
{
    _cols = std::max(columns, 0);
    _rows = std::max(rows, 0);
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (::ioctl(_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        setDimensions(ws.ws_col, ws.ws_row);
}

void TerminalOutput::appendSgr(Style const& style)
{
    // Start with a reset so attributes never leak between spans.
    auto sgr = std::string { "\033[0" };
    if (style.bold)
        sgr += ";1";
    if (style.dim)
        sgr += ";2";
    if (style.italic)
        sgr += ";3";
    if (style.underline)
        sgr += ";4";
    if (style.inverse)
        sgr += ";7";
    appendColor(sgr, style.fg, 38);
    appendColor(sgr, style.bg, 48);
    sgr += 'm';
    _buffer += sgr;
}

} // namespace tailview::tui
