#include <longpress/ui/Element.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace LP::UI {

Element::Element(std::string name)
    : name_(std::move(name)) {}

auto Element::mount() -> void {
    mounted_ = true;
    lp_log("mount " + name_, "Element", "Lifecycle");
    loaded.emit();
}

auto Element::unmount() -> void {
    if (!mounted_) {
        return;
    }
    lp_log("unmount " + name_, "Element", "Lifecycle");
    // Subscribers release their resources while the element is still attached.
    unloaded.emit();
    if (focused_) {
        focused_ = false;
        on_lost_keyboard_focus(IO::FocusEvent{.reason = IO::FocusReason::WindowDeactivated});
    }
    pointer_over_ = false;
    mounted_      = false;
}

auto Element::set_enabled(bool enabled) -> void {
    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    if (!enabled_ && focused_) {
        focused_ = false;
        on_lost_keyboard_focus(IO::FocusEvent{});
    }
    on_enabled_changed(enabled_);
}

auto Element::pointer_down(IO::PointerEventPtr const& event) -> void {
    if (!event || !accepts_input()) {
        return;
    }
    on_pointer_down(event);
}

auto Element::pointer_up(IO::PointerEventPtr const& event) -> void {
    if (!event || !accepts_input()) {
        return;
    }
    on_pointer_up(event);
}

auto Element::pointer_enter(IO::PointerEventPtr const& event) -> void {
    if (!event) {
        return;
    }
    pointer_over_ = true;
    if (accepts_input()) {
        on_pointer_enter(event);
    }
}

auto Element::pointer_leave(IO::PointerEventPtr const& event) -> void {
    if (!event) {
        return;
    }
    pointer_over_ = false;
    if (mounted_) {
        on_pointer_leave(event);
    }
}

auto Element::key_down(IO::KeyEventPtr const& event) -> void {
    if (!event || !accepts_input() || !focused_) {
        return;
    }
    on_key_down(event);
}

auto Element::key_up(IO::KeyEventPtr const& event) -> void {
    if (!event || !accepts_input() || !focused_) {
        return;
    }
    on_key_up(event);
}

auto Element::focus() -> bool {
    if (!accepts_input()) {
        return false;
    }
    if (!focused_) {
        focused_ = true;
        on_got_keyboard_focus();
    }
    return true;
}

auto Element::lose_keyboard_focus(IO::FocusEvent const& event) -> void {
    if (!focused_) {
        return;
    }
    focused_ = false;
    on_lost_keyboard_focus(event);
}

} // namespace LP::UI
