// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <unistd.h>

namespace tailview::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Default color, 256-color palette index, or true color.
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;
    Color bg;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool dim = false;
    bool inverse = false;

    /// @brief True if no attribute or color is set.
    [[nodiscard]] auto isPlain() const noexcept -> bool;
};

/// @brief RAII guard for synchronized terminal output (CSI ?2026h/l).
class SyncGuard
{
  public:
    explicit SyncGuard(int fd);
    ~SyncGuard();

    SyncGuard(SyncGuard const&) = delete;
    auto operator=(SyncGuard const&) -> SyncGuard& = delete;
    SyncGuard(SyncGuard&&) = delete;
    auto operator=(SyncGuard&&) -> SyncGuard& = delete;

  private:
    int _fd;
};

/// @brief Buffered styled output to a terminal file descriptor.
///
/// All drawing calls append to an internal buffer; nothing reaches the
/// terminal until flush(). Tests inspect the buffer directly.
class TerminalOutput
{
  public:
    explicit TerminalOutput(int fd = STDOUT_FILENO);

    /// @brief Queries the terminal dimensions.
    /// @return Success, or TerminalError if the descriptor is not a terminal.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes text without any styling.
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute 1-based position.
    void moveTo(int row, int col);

    void clearLine();
    void clearScreen();
    void enterAltScreen();
    void leaveAltScreen();
    void showCursor();
    void hideCursor();

    /// @brief Flushes pending output, then begins a synchronized update.
    [[nodiscard]] auto syncGuard() -> SyncGuard;

    /// @brief Writes the buffer to the descriptor and clears it.
    void flush();

    /// @brief Returns the pending, not yet flushed output.
    [[nodiscard]] auto buffer() const noexcept -> std::string const&;

    [[nodiscard]] auto columns() const noexcept -> int;
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Overrides the cached dimensions (resize events, tests).
    void setDimensions(int columns, int rows);

    /// @brief Re-queries the dimensions from the terminal.
    void updateDimensions();

  private:
    int _fd;
    std::string _buffer;
    int _cols = 80;
    int _rows = 24;

    void appendSgr(Style const& style);
};

} // namespace tailview::tui
