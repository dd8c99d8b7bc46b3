#include <longpress/ui/ClickButton.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace LP::UI {

auto clickModeToString(ClickMode mode) -> std::string_view {
    switch (mode) {
    case ClickMode::Release:
        return "release";
    case ClickMode::Press:
        return "press";
    }
    return "release";
}

ClickButton::ClickButton(std::string name, ClickMode mode)
    : Element(std::move(name)), click_mode_(mode) {}

auto ClickButton::state() const -> ButtonState {
    return ButtonState{.enabled = is_enabled(),
                       .pressed = pressed_,
                       .hovered = is_pointer_over(),
                       .focused = has_keyboard_focus()};
}

auto ClickButton::click() -> bool {
    if (!accepts_input()) {
        return false;
    }
    activate(ActivationEvent{.source = ActivationSource::Programmatic});
    return true;
}

void ClickButton::on_pointer_down(IO::PointerEventPtr const& event) {
    if (event->button != IO::PointerButton::Primary) {
        return;
    }
    (void)focus();
    pointer_captured_ = true;
    pressed_          = true;
    if (click_mode_ == ClickMode::Press) {
        activate(ActivationEvent{.source = ActivationSource::Pointer, .pointer = event});
    }
}

void ClickButton::on_pointer_up(IO::PointerEventPtr const& event) {
    if (event->button != IO::PointerButton::Primary || !pointer_captured_) {
        return;
    }
    pointer_captured_ = false;
    bool const was_pressed = pressed_;
    pressed_               = space_held_;
    if (click_mode_ == ClickMode::Release && was_pressed && is_pointer_over()) {
        activate(ActivationEvent{.source = ActivationSource::Pointer, .pointer = event});
    }
}

void ClickButton::on_pointer_enter(IO::PointerEventPtr const&) {
    if (pointer_captured_) {
        pressed_ = true;
    }
}

void ClickButton::on_pointer_leave(IO::PointerEventPtr const&) {
    if (pointer_captured_ && !space_held_) {
        pressed_ = false;
    }
}

void ClickButton::on_key_down(IO::KeyEventPtr const& event) {
    switch (event->key) {
    case IO::Key::Space:
        if (IO::isSystemMenuChord(event->modifiers) || event->repeat || space_held_) {
            return;
        }
        space_held_ = true;
        pressed_    = true;
        if (click_mode_ == ClickMode::Press) {
            activate(ActivationEvent{.source = ActivationSource::SpaceKey, .key = event});
        }
        return;
    case IO::Key::Enter:
        activate(ActivationEvent{.source = ActivationSource::EnterKey, .key = event});
        return;
    default:
        return;
    }
}

void ClickButton::on_key_up(IO::KeyEventPtr const& event) {
    if (event->key != IO::Key::Space || !space_held_) {
        return;
    }
    space_held_            = false;
    bool const was_pressed = pressed_;
    pressed_               = pointer_captured_ && is_pointer_over();
    if (click_mode_ == ClickMode::Release && was_pressed) {
        activate(ActivationEvent{.source = ActivationSource::SpaceKey, .key = event});
    }
}

void ClickButton::on_lost_keyboard_focus(IO::FocusEvent const&) {
    if (!space_held_) {
        return;
    }
    space_held_ = false;
    pressed_    = pointer_captured_;
}

void ClickButton::on_enabled_changed(bool enabled) {
    if (enabled) {
        return;
    }
    pressed_          = false;
    pointer_captured_ = false;
    space_held_       = false;
}

void ClickButton::on_activated(ActivationEvent const& event) {
    activated.emit(event);
}

auto ClickButton::activate(ActivationEvent event) -> void {
    ++activation_count_;
    lp_log(std::string{"activate "} + std::string{name()} + " mode=" + std::string{clickModeToString(click_mode_)},
           "ClickButton");
    on_activated(event);
}

} // namespace LP::UI
