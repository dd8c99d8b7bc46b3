#include <longpress/ui/LongPressButton.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace LP::UI {

LongPressButton::LongPressButton(Runtime::EventLoop& loop, LongPressOptions options)
    : LongPressButton(Runtime::MakeLoopIntervalTimer(loop, kCountdownInterval), std::move(options)) {}

LongPressButton::LongPressButton(std::unique_ptr<Runtime::IntervalTimer> timer, LongPressOptions options)
    : ClickButton(std::move(options.name), options.click_mode)
    , timer_(std::move(timer))
    , design_mode_(options.design_mode || !timer_)
    , long_press_enabled_(kIsLongPressEnabledProperty, options.long_press_enabled)
    , hold_seconds_(kHoldSecondsProperty, options.hold_seconds)
    , left_seconds_(kLeftSecondsProperty, std::nullopt) {
    if (design_mode_) {
        return;
    }
    timer_->set_interval(kCountdownInterval);
    timer_->set_tick_handler([this] { this->on_countdown_tick(); });
    loaded_connection_ = loaded.connect([this] { this->handle_loaded(); });
}

LongPressButton::~LongPressButton() {
    if (timer_) {
        timer_->stop();
    }
}

auto LongPressButton::apply(LongPressOptions const& options) -> void {
    set_long_press_enabled(options.long_press_enabled);
    set_hold_seconds(options.hold_seconds);
    set_click_mode(options.click_mode);
}

auto LongPressButton::cancel_hold() -> bool {
    return stop_countdown_if_active("cancel requested");
}

auto LongPressButton::handle_loaded() -> void {
    // Hosts may report the same mount several times; hook unloaded only once.
    if (unloaded_connection_) {
        return;
    }
    unloaded_connection_ = unloaded.connect([this] { this->handle_unloaded(); });
}

auto LongPressButton::handle_unloaded() -> void {
    stop_countdown_if_active("unmounted");
    if (unloaded_connection_) {
        unloaded.disconnect(*unloaded_connection_);
        unloaded_connection_.reset();
    }
}

auto LongPressButton::start_countdown_if_idle() -> bool {
    if (is_counting_down()) {
        return false;
    }
    if (!is_long_press_enabled() || hold_seconds() < 1) {
        lp_log(std::string{name()} + ": hold bypassed, replaying press", "LongPress");
        replay_captures();
        return false;
    }

    left_seconds_.set(hold_seconds());
    if (auto started = timer_->start(); !started) {
        lp_log(std::string{name()} + ": countdown timer failed (" + describeError(started.error())
                   + "), replaying press",
               "LongPress", "ERROR");
        left_seconds_.set(std::nullopt);
        replay_captures();
        return false;
    }
    lp_log(std::string{name()} + ": hold started, " + std::to_string(hold_seconds()) + "s", "LongPress");
    return true;
}

auto LongPressButton::stop_countdown_if_active([[maybe_unused]] std::string_view reason) -> bool {
    if (!is_counting_down()) {
        return false;
    }
    timer_->stop();
    captures_ = PendingCaptures{};
    left_seconds_.set(std::nullopt);
    lp_log(std::string{name()} + ": hold cancelled, " + std::string{reason}, "LongPress");
    return true;
}

auto LongPressButton::on_countdown_tick() -> void {
    auto const left = left_seconds_.get();
    if (!left) {
        timer_->stop();
        return;
    }
    if (*left <= 1) {
        timer_->stop();
        left_seconds_.set(std::nullopt);
        lp_log(std::string{name()} + ": hold complete", "LongPress");
        replay_captures();
        return;
    }
    left_seconds_.set(*left - 1);
    lp_log(std::string{name()} + ": " + std::to_string(*left - 1) + "s left", "LongPress", "Tick");
}

auto LongPressButton::replay_captures() -> void {
    // Presses made by activation handlers during the replay start a new hold.
    auto const pending = std::exchange(captures_, PendingCaptures{});
    if (pending.pointer) {
        ClickButton::on_pointer_down(pending.pointer);
    }
    if (pending.space_key) {
        ClickButton::on_key_down(pending.space_key);
    }
    if (pending.enter_key) {
        ClickButton::on_key_down(pending.enter_key);
    }
}

void LongPressButton::on_pointer_down(IO::PointerEventPtr const& event) {
    if (design_mode_ || event->button != IO::PointerButton::Primary) {
        ClickButton::on_pointer_down(event);
        return;
    }
    if (is_counting_down()) {
        lp_log(std::string{name()} + ": pointer press ignored, hold already active", "LongPress");
        return;
    }
    captures_.pointer = event;
    start_countdown_if_idle();
}

void LongPressButton::on_pointer_up(IO::PointerEventPtr const& event) {
    if (event->button == IO::PointerButton::Primary && captures_.pointer) {
        stop_countdown_if_active("pointer released");
    }
    ClickButton::on_pointer_up(event);
}

void LongPressButton::on_pointer_leave(IO::PointerEventPtr const& event) {
    if (captures_.pointer) {
        stop_countdown_if_active("pointer left");
    }
    ClickButton::on_pointer_leave(event);
}

void LongPressButton::on_key_down(IO::KeyEventPtr const& event) {
    if (design_mode_) {
        ClickButton::on_key_down(event);
        return;
    }

    IO::KeyEventPtr* slot = nullptr;
    switch (event->key) {
    case IO::Key::Space:
        if (IO::isSystemMenuChord(event->modifiers)) {
            ClickButton::on_key_down(event);
            return;
        }
        slot = &captures_.space_key;
        break;
    case IO::Key::Enter:
        slot = &captures_.enter_key;
        break;
    default:
        ClickButton::on_key_down(event);
        return;
    }

    // Auto-repeat carries nothing new; only the first key-down counts.
    if (event->repeat) {
        return;
    }
    if (is_counting_down()) {
        lp_log(std::string{name()} + ": key press ignored, hold already active", "LongPress");
        return;
    }
    *slot = event;
    start_countdown_if_idle();
}

void LongPressButton::on_key_up(IO::KeyEventPtr const& event) {
    if (event->key == IO::Key::Space && !IO::isSystemMenuChord(event->modifiers) && captures_.space_key) {
        stop_countdown_if_active("space released");
    }
    if (event->key == IO::Key::Enter && captures_.enter_key) {
        stop_countdown_if_active("enter released");
    }
    ClickButton::on_key_up(event);
}

void LongPressButton::on_lost_keyboard_focus(IO::FocusEvent const& event) {
    // Only a keyboard-started hold ends with focus; a pointer hold survives Tab.
    if (captures_.keyboard()) {
        stop_countdown_if_active("keyboard focus lost");
    }
    ClickButton::on_lost_keyboard_focus(event);
}

void LongPressButton::on_enabled_changed(bool enabled) {
    if (!enabled) {
        stop_countdown_if_active("disabled");
    }
    ClickButton::on_enabled_changed(enabled);
}

} // namespace LP::UI
