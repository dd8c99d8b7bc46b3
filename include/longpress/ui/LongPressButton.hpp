#pragma once

#include <longpress/io/IoEvents.hpp>
#include <longpress/runtime/EventLoop.hpp>
#include <longpress/runtime/IntervalTimer.hpp>
#include <longpress/ui/ClickButton.hpp>
#include <longpress/ui/LongPressConfig.hpp>
#include <longpress/ui/Property.hpp>
#include <longpress/ui/Signal.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace LP::UI {

/**
 * LongPressButton: button that activates only after being held.
 *
 * A primary pointer press, a space key-down or an enter key-down is captured
 * instead of reaching ClickButton. The capture starts a countdown of
 * HoldSeconds one-second ticks; LeftSeconds reports the seconds left. When the
 * countdown expires the captured events are replayed into ClickButton (pointer,
 * then space, then enter), so `activated` fires with the original event objects.
 *
 * Only one countdown runs at a time: while it is active, presses from any
 * source are swallowed and neither restart, extend nor join it. Releasing the
 * captured key, pointer release or leave for a pointer capture, keyboard focus
 * loss for a key capture, disabling and unmounting all cancel the hold; events
 * from a source that holds no capture never cancel.
 *
 * With IsLongPressEnabled false or HoldSeconds below one, presses are replayed
 * immediately and LeftSeconds stays empty.
 */
class LongPressButton : public ClickButton {
public:
    static constexpr int                       kDefaultHoldSeconds = 3;
    static constexpr std::chrono::seconds      kCountdownInterval{1};
    static constexpr std::string_view          kIsLongPressEnabledProperty = "IsLongPressEnabled";
    static constexpr std::string_view          kHoldSecondsProperty = "HoldSeconds";
    static constexpr std::string_view          kLeftSecondsProperty = "LeftSeconds";

    struct PendingCaptures {
        IO::PointerEventPtr pointer{};
        IO::KeyEventPtr     space_key{};
        IO::KeyEventPtr     enter_key{};

        [[nodiscard]] auto any() const -> bool { return pointer || space_key || enter_key; }
        [[nodiscard]] auto keyboard() const -> bool { return space_key || enter_key; }
    };

    LongPressButton(Runtime::EventLoop& loop, LongPressOptions options = {});
    // A null timer leaves the button in design mode.
    LongPressButton(std::unique_ptr<Runtime::IntervalTimer> timer, LongPressOptions options = {});
    ~LongPressButton() override;

    [[nodiscard]] auto is_long_press_enabled() const -> bool { return long_press_enabled_.get(); }
    auto set_long_press_enabled(bool enabled) -> void { long_press_enabled_.set(enabled); }

    [[nodiscard]] auto hold_seconds() const -> int { return hold_seconds_.get(); }
    auto set_hold_seconds(int seconds) -> void { hold_seconds_.set(seconds); }

    [[nodiscard]] auto left_seconds() const -> std::optional<int> { return left_seconds_.get(); }
    [[nodiscard]] auto is_counting_down() const -> bool { return left_seconds_.get().has_value(); }

    [[nodiscard]] auto long_press_enabled_property() const -> Property<bool> const& { return long_press_enabled_; }
    [[nodiscard]] auto hold_seconds_property() const -> Property<int> const& { return hold_seconds_; }
    [[nodiscard]] auto left_seconds_property() const -> Property<std::optional<int>> const& { return left_seconds_; }

    [[nodiscard]] auto captures() const -> PendingCaptures const& { return captures_; }
    [[nodiscard]] auto is_design_mode() const -> bool { return design_mode_; }
    [[nodiscard]] auto is_timer_running() const -> bool { return timer_ && timer_->is_running(); }

    // Cancels an active hold. Returns false when idle.
    auto cancel_hold() -> bool;

    // Applies enable flag, hold duration and click mode. Name and design mode are
    // construction-time only.
    auto apply(LongPressOptions const& options) -> void;

protected:
    void on_pointer_down(IO::PointerEventPtr const& event) override;
    void on_pointer_up(IO::PointerEventPtr const& event) override;
    void on_pointer_leave(IO::PointerEventPtr const& event) override;
    void on_key_down(IO::KeyEventPtr const& event) override;
    void on_key_up(IO::KeyEventPtr const& event) override;
    void on_lost_keyboard_focus(IO::FocusEvent const& event) override;
    void on_enabled_changed(bool enabled) override;

private:
    auto start_countdown_if_idle() -> bool;
    auto stop_countdown_if_active(std::string_view reason) -> bool;
    auto on_countdown_tick() -> void;
    auto replay_captures() -> void;
    auto handle_loaded() -> void;
    auto handle_unloaded() -> void;

    std::unique_ptr<Runtime::IntervalTimer> timer_;
    bool                                    design_mode_;
    Property<bool>                          long_press_enabled_;
    Property<int>                           hold_seconds_;
    Property<std::optional<int>>            left_seconds_;
    PendingCaptures                         captures_;
    std::optional<ConnectionId>             loaded_connection_;
    std::optional<ConnectionId>             unloaded_connection_;
};

} // namespace LP::UI
