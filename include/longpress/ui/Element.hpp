#pragma once

#include <longpress/io/IoEvents.hpp>
#include <longpress/ui/Signal.hpp>

#include <string>
#include <string_view>

namespace LP::UI {

/**
 * Element: host-facing surface of a control.
 *
 * The host reports lifecycle (mount/unmount), focus and raw input through the
 * public entry points; subclasses react in the protected on_* hooks. Input hooks
 * run only while the element is mounted and enabled. Bookkeeping for hover and
 * focus is kept up to date regardless so a disabled element never keeps a
 * stale pressed/hover/focus state.
 */
class Element {
public:
    explicit Element(std::string name);
    virtual ~Element() = default;

    Element(Element const&)            = delete;
    Element& operator=(Element const&) = delete;

    [[nodiscard]] auto name() const -> std::string_view { return name_; }

    // Lifecycle notifications. Hosts may deliver mount() more than once for
    // the same instance; every call is forwarded to `loaded`.
    auto mount() -> void;
    auto unmount() -> void;
    [[nodiscard]] auto is_mounted() const -> bool { return mounted_; }

    auto set_enabled(bool enabled) -> void;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    [[nodiscard]] auto has_keyboard_focus() const -> bool { return focused_; }
    [[nodiscard]] auto is_pointer_over() const -> bool { return pointer_over_; }

    auto pointer_down(IO::PointerEventPtr const& event) -> void;
    auto pointer_up(IO::PointerEventPtr const& event) -> void;
    auto pointer_enter(IO::PointerEventPtr const& event) -> void;
    auto pointer_leave(IO::PointerEventPtr const& event) -> void;
    auto key_down(IO::KeyEventPtr const& event) -> void;
    auto key_up(IO::KeyEventPtr const& event) -> void;
    auto focus() -> bool;
    auto lose_keyboard_focus(IO::FocusEvent const& event = {}) -> void;

    Signal<> loaded;
    Signal<> unloaded;

protected:
    [[nodiscard]] auto accepts_input() const -> bool { return mounted_ && enabled_; }

    virtual void on_pointer_down(IO::PointerEventPtr const&) {}
    virtual void on_pointer_up(IO::PointerEventPtr const&) {}
    virtual void on_pointer_enter(IO::PointerEventPtr const&) {}
    virtual void on_pointer_leave(IO::PointerEventPtr const&) {}
    virtual void on_key_down(IO::KeyEventPtr const&) {}
    virtual void on_key_up(IO::KeyEventPtr const&) {}
    virtual void on_got_keyboard_focus() {}
    virtual void on_lost_keyboard_focus(IO::FocusEvent const&) {}
    virtual void on_enabled_changed(bool) {}

private:
    std::string name_;
    bool        mounted_      = false;
    bool        enabled_      = true;
    bool        focused_      = false;
    bool        pointer_over_ = false;
};

} // namespace LP::UI
