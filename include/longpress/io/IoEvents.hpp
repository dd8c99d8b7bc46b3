#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace LP::IO {

enum class ButtonModifiers : std::uint32_t {
    None     = 0,
    Shift    = 1u << 0,
    Control  = 1u << 1,
    Alt      = 1u << 2,
    Command  = 1u << 3,
    Function = 1u << 4
};

[[nodiscard]] constexpr auto operator|(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) |
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) &
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(ButtonModifiers value, ButtonModifiers flag) -> bool {
    return (value & flag) != ButtonModifiers::None;
}

// Alt held without Control: the platform reserves Alt+Space for the window menu.
[[nodiscard]] constexpr auto isSystemMenuChord(ButtonModifiers value) -> bool {
    return (value & (ButtonModifiers::Control | ButtonModifiers::Alt)) == ButtonModifiers::Alt;
}

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Secondary,
    Middle
};

enum class Key : std::uint32_t {
    Other = 0,
    Space,
    Enter,
    Tab,
    Escape
};

enum class FocusReason : std::uint8_t {
    Other = 0,
    Tab,
    Pointer,
    WindowDeactivated
};

struct PointerEvent {
    std::string              device_path;
    std::uint64_t            pointer_id = 0;
    PointerButton            button     = PointerButton::Primary;
    float                    x          = 0.0f;
    float                    y          = 0.0f;
    ButtonModifiers          modifiers  = ButtonModifiers::None;
    std::chrono::nanoseconds timestamp{};

    friend std::ostream& operator<<(std::ostream& os, PointerEvent const& e) {
        return os << "[pointer] id=" << e.pointer_id << " button=" << static_cast<int>(e.button)
                  << " at=(" << e.x << ", " << e.y << ")";
    }
};

struct KeyEvent {
    std::string              device_path;
    Key                      key       = Key::Other;
    std::uint32_t            keycode   = 0;
    bool                     pressed   = true;
    bool                     repeat    = false;
    ButtonModifiers          modifiers = ButtonModifiers::None;
    std::chrono::nanoseconds timestamp{};

    friend std::ostream& operator<<(std::ostream& os, KeyEvent const& e) {
        os << "[key] " << (e.pressed ? "down" : "up") << " key=" << static_cast<std::uint32_t>(e.key)
           << " code=" << e.keycode << " mods=" << static_cast<std::uint32_t>(e.modifiers);
        if (e.repeat) {
            os << " repeat";
        }
        return os;
    }
};

struct FocusEvent {
    FocusReason              reason = FocusReason::Other;
    std::chrono::nanoseconds timestamp{};
};

using PointerEventPtr = std::shared_ptr<PointerEvent const>;
using KeyEventPtr     = std::shared_ptr<KeyEvent const>;

} // namespace LP::IO
