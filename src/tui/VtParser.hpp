// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace tailview::tui
{

/// @brief Incremental decoder for the VT input a viewer needs.
///
/// Understands plain and control characters, UTF-8, CSI cursor and editing keys
/// (arrows, Home/End, PageUp/PageDown), SS3 cursor keys and SGR mouse reports.
/// Anything else is consumed and dropped. A lone ESC is resolved by timeout().
class VtParser
{
  public:
    /// @brief Feeds raw bytes and returns the events they complete.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a pending bare ESC after an input pause.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Utf8,
    };

    State _state = State::Ground;
    std::string _pending; ///< CSI parameter bytes or partial UTF-8 sequence.
    int _utf8Remaining = 0;

    void ground(std::uint8_t byte, std::vector<InputEvent>& events);
    void escape(std::uint8_t byte, std::vector<InputEvent>& events);
    void csi(std::uint8_t byte, std::vector<InputEvent>& events);
    void ss3(std::uint8_t byte, std::vector<InputEvent>& events);
    void utf8(std::uint8_t byte, std::vector<InputEvent>& events);

    void dispatchCsi(char finalByte, std::vector<InputEvent>& events) const;
};

} // namespace tailview::tui
