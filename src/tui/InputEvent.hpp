// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <variant>

namespace tailview::tui
{

/// @brief Key codes for keyboard events.
///
/// Printable characters use their Unicode codepoint directly (cast to KeyCode).
/// Navigation keys live above the BMP so they never collide with a codepoint.
enum class KeyCode : std::uint32_t
{
    Enter = 0x10000,
    Tab,
    Backspace,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
};

/// @brief Converts a Unicode codepoint to a KeyCode.
[[nodiscard]] constexpr auto keyCodeFromCodepoint(char32_t codepoint) noexcept -> KeyCode
{
    return static_cast<KeyCode>(codepoint);
}

/// @brief Bitmask of keyboard modifiers.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    return lhs = lhs | rhs;
}

/// @brief Tests whether @p flag is set in @p mods.
[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (static_cast<std::uint8_t>(mods) & static_cast<std::uint8_t>(flag)) != 0;
}

/// @brief Keyboard input event.
struct KeyEvent
{
    KeyCode key {};                      ///< Key code (printable uses codepoint, special keys use enum).
    Modifier modifiers = Modifier::None; ///< Active modifier keys.
    char32_t codepoint = 0;              ///< Original Unicode codepoint (0 for non-printable keys).
};

/// @brief Mouse input event (SGR reporting).
struct MouseEvent
{
    enum class Type : std::uint8_t
    {
        Press,
        Release,
        ScrollUp,
        ScrollDown,
    };

    Type type {};
    int button = 0; ///< 0=left, 1=middle, 2=right.
    int x = 0;      ///< Column (1-based).
    int y = 0;      ///< Row (1-based).
};

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns;
    int rows;
};

/// @brief Any decoded terminal input.
using InputEvent = std::variant<KeyEvent, MouseEvent, ResizeEvent>;

} // namespace tailview::tui
