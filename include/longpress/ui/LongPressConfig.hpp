#pragma once

#include <longpress/core/Error.hpp>
#include <longpress/ui/ClickButton.hpp>

#include <string>
#include <string_view>

namespace LP::UI {

struct LongPressOptions {
    std::string name = "long_press_button";
    bool long_press_enabled = true;
    int hold_seconds = 3;
    ClickMode click_mode = ClickMode::Press;
    // Design-time previews behave as plain buttons: no timer, no lifecycle hooks.
    bool design_mode = false;
};

struct LongPressEnvironment {
    static constexpr std::string_view kEnabled = "LONGPRESS_ENABLED";
    static constexpr std::string_view kHoldSeconds = "LONGPRESS_HOLD_SECONDS";
    static constexpr std::string_view kDesignMode = "LONGPRESS_DESIGN_MODE";
};

// Keys: name, long_press_enabled, hold_seconds, click_mode ("press"/"release"),
// design_mode. Absent keys keep the value from `base`; unknown keys are ignored.
[[nodiscard]] auto ParseLongPressOptions(std::string_view json,
                                         LongPressOptions base = {}) -> LP::Expected<LongPressOptions>;

[[nodiscard]] auto LongPressOptionsToJson(LongPressOptions const& options) -> std::string;

[[nodiscard]] auto ApplyLongPressEnvironment(LongPressOptions options) -> LP::Expected<LongPressOptions>;

} // namespace LP::UI
