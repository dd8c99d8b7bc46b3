#pragma once

#include <longpress/io/IoEvents.hpp>
#include <longpress/ui/Element.hpp>
#include <longpress/ui/Signal.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace LP::UI {

enum class ClickMode : std::uint8_t {
    Release = 0,
    Press
};

[[nodiscard]] auto clickModeToString(ClickMode mode) -> std::string_view;

struct ButtonState {
    bool enabled = true;
    bool pressed = false;
    bool hovered = false;
    bool focused = false;
};

enum class ActivationSource : std::uint8_t {
    Pointer = 0,
    SpaceKey,
    EnterKey,
    Programmatic
};

// The event pointer is the input event object that triggered the activation,
// not a copy.
struct ActivationEvent {
    ActivationSource    source = ActivationSource::Programmatic;
    IO::PointerEventPtr pointer{};
    IO::KeyEventPtr     key{};
};

/**
 * ClickButton: clickable button with immediate activation.
 *
 * ClickMode::Release activates on primary release over the button or on space
 * key-up; ClickMode::Press activates on primary press or space key-down. Enter
 * key-down always activates. Alt+Space is left to the platform.
 */
class ClickButton : public Element {
public:
    explicit ClickButton(std::string name, ClickMode mode = ClickMode::Release);

    [[nodiscard]] auto click_mode() const -> ClickMode { return click_mode_; }
    auto set_click_mode(ClickMode mode) -> void { click_mode_ = mode; }

    [[nodiscard]] auto state() const -> ButtonState;
    [[nodiscard]] auto is_pressed() const -> bool { return pressed_; }
    [[nodiscard]] auto activation_count() const -> std::uint64_t { return activation_count_; }

    // Programmatic activation; ignored while unmounted or disabled.
    auto click() -> bool;

    Signal<ActivationEvent const&> activated;

protected:
    void on_pointer_down(IO::PointerEventPtr const& event) override;
    void on_pointer_up(IO::PointerEventPtr const& event) override;
    void on_pointer_enter(IO::PointerEventPtr const& event) override;
    void on_pointer_leave(IO::PointerEventPtr const& event) override;
    void on_key_down(IO::KeyEventPtr const& event) override;
    void on_key_up(IO::KeyEventPtr const& event) override;
    void on_lost_keyboard_focus(IO::FocusEvent const& event) override;
    void on_enabled_changed(bool enabled) override;

    virtual void on_activated(ActivationEvent const& event);

private:
    auto activate(ActivationEvent event) -> void;

    ClickMode     click_mode_;
    bool          pressed_          = false;
    bool          pointer_captured_ = false;
    bool          space_held_       = false;
    std::uint64_t activation_count_ = 0;
};

} // namespace LP::UI
