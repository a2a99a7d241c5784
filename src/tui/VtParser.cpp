// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <optional>
#include <ranges>

#include <tui/VtParser.hpp>

namespace tailview::tui
{

namespace
{
    auto splitParams(std::string_view buf) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        for (auto const part: buf | std::views::split(';'))
        {
            auto const sv = std::string_view(part.begin(), part.end());
            auto value = 0;
            auto const [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            result.push_back(ec == std::errc {} ? value : 0);
        }
        return result;
    }

    /// CSI modifier parameters are encoded as 1 + bitmask(shift=1, alt=2, ctrl=4).
    constexpr auto decodeModifiers(int param) noexcept -> Modifier
    {
        auto mods = Modifier::None;
        if (param <= 1)
            return mods;
        auto const bits = param - 1;
        if (bits & 1)
            mods |= Modifier::Shift;
        if (bits & 2)
            mods |= Modifier::Alt;
        if (bits & 4)
            mods |= Modifier::Ctrl;
        return mods;
    }

    auto cursorKey(char finalByte) noexcept -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            default: return std::nullopt;
        }
    }

    auto tildeKey(int code) noexcept -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
            default: return std::nullopt;
        }
    }

    auto decodeUtf8(std::string_view bytes) noexcept -> char32_t
    {
        auto const b = [&](std::size_t i) { return static_cast<char32_t>(static_cast<std::uint8_t>(bytes[i])); };
        switch (bytes.size())
        {
            case 2: return ((b(0) & 0x1F) << 6) | (b(1) & 0x3F);
            case 3: return ((b(0) & 0x0F) << 12) | ((b(1) & 0x3F) << 6) | (b(2) & 0x3F);
            case 4: return ((b(0) & 0x07) << 18) | ((b(1) & 0x3F) << 12) | ((b(2) & 0x3F) << 6) | (b(3) & 0x3F);
            default: return 0;
        }
    }
} // namespace

auto VtParser::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: ground(byte, events); break;
            case State::Escape: escape(byte, events); break;
            case State::Csi: csi(byte, events); break;
            case State::Ss3: ss3(byte, events); break;
            case State::Utf8: utf8(byte, events); break;
        }
    }
    return events;
}

auto VtParser::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(KeyEvent { .key = KeyCode::Escape });
        _state = State::Ground;
    }
    return events;
}

void VtParser::ground(std::uint8_t byte, std::vector<InputEvent>& events)
{
    switch (byte)
    {
        case 0x1B: _state = State::Escape; return;
        case '\r':
        case '\n': events.emplace_back(KeyEvent { .key = KeyCode::Enter }); return;
        case '\t': events.emplace_back(KeyEvent { .key = KeyCode::Tab }); return;
        case 0x08:
        case 0x7F: events.emplace_back(KeyEvent { .key = KeyCode::Backspace }); return;
        default: break;
    }

    if (byte < 0x20)
    {
        // Ctrl+letter arrives as letter - 'a' + 1.
        auto const cp = static_cast<char32_t>(byte + 'a' - 1);
        events.emplace_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = Modifier::Ctrl, .codepoint = cp });
        return;
    }

    if (byte >= 0x80)
    {
        if ((byte & 0xE0) == 0xC0)
            _utf8Remaining = 1;
        else if ((byte & 0xF0) == 0xE0)
            _utf8Remaining = 2;
        else if ((byte & 0xF8) == 0xF0)
            _utf8Remaining = 3;
        else
            return;
        _pending.assign(1, static_cast<char>(byte));
        _state = State::Utf8;
        return;
    }

    auto const cp = static_cast<char32_t>(byte);
    events.emplace_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .codepoint = cp });
}

void VtParser::escape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (byte == '[')
    {
        _pending.clear();
        _state = State::Csi;
        return;
    }
    if (byte == 'O')
    {
        _state = State::Ss3;
        return;
    }
    if (byte >= 0x20 && byte < 0x7F)
    {
        auto const cp = static_cast<char32_t>(byte);
        events.emplace_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = Modifier::Alt, .codepoint = cp });
        return;
    }

    events.emplace_back(KeyEvent { .key = KeyCode::Escape });
    ground(byte, events);
}

void VtParser::csi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte >= 0x40 && byte <= 0x7E)
    {
        _state = State::Ground;
        dispatchCsi(static_cast<char>(byte), events);
        return;
    }
    if (byte >= 0x20 && byte <= 0x3F)
    {
        _pending += static_cast<char>(byte);
        return;
    }
    _state = State::Ground;
}

void VtParser::ss3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = cursorKey(static_cast<char>(byte)))
        events.emplace_back(KeyEvent { .key = *key });
}

void VtParser::utf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        _state = State::Ground;
        ground(byte, events);
        return;
    }

    _pending += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    _state = State::Ground;
    if (auto const cp = decodeUtf8(_pending); cp != 0)
        events.emplace_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .codepoint = cp });
}

void VtParser::dispatchCsi(char finalByte, std::vector<InputEvent>& events) const
{
    // SGR mouse: CSI < button ; x ; y (M|m)
    if (_pending.starts_with('<') && (finalByte == 'M' || finalByte == 'm'))
    {
        auto const params = splitParams(std::string_view(_pending).substr(1));
        if (params.size() < 3)
            return;

        auto const button = params[0];
        auto event = MouseEvent { .button = button & 3, .x = params[1], .y = params[2] };
        if ((button & 0x43) == 64)
            event.type = MouseEvent::Type::ScrollUp;
        else if ((button & 0x43) == 65)
            event.type = MouseEvent::Type::ScrollDown;
        else if (button & 32)
            return; // motion
        else
            event.type = finalByte == 'm' ? MouseEvent::Type::Release : MouseEvent::Type::Press;
        events.emplace_back(event);
        return;
    }

    if (!_pending.empty() && (_pending[0] == '<' || _pending[0] == '>' || _pending[0] == '?'))
        return;

    auto const params = splitParams(_pending);
    auto const mods = params.size() >= 2 ? decodeModifiers(params[1]) : Modifier::None;

    auto const key = finalByte == '~' ? tildeKey(params.empty() ? 0 : params[0]) : cursorKey(finalByte);
    if (key)
        events.emplace_back(KeyEvent { .key = *key, .modifiers = mods });
}

} // namespace tailview::tui
