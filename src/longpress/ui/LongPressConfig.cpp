#include <longpress/ui/LongPressConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

namespace LP::UI {

namespace {

using json = nlohmann::json;

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_truthy(char const* value) -> bool {
    std::string_view text = trim(value);
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto parse_int(std::string_view text) -> std::optional<int> {
    text = trim(text);
    int value = 0;
    auto const* first = text.data();
    auto const* last  = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

auto parse_click_mode(std::string_view text) -> std::optional<ClickMode> {
    if (text == "press") {
        return ClickMode::Press;
    }
    if (text == "release") {
        return ClickMode::Release;
    }
    return std::nullopt;
}

auto type_error(std::string_view key, std::string_view expected) -> LP::Error {
    return LP::Error{LP::Error::Code::InvalidType,
                     std::string{key} + " must be " + std::string{expected}};
}

auto getenv_view(std::string_view name) -> char const* {
    return std::getenv(std::string{name}.c_str());
}

} // namespace

auto ParseLongPressOptions(std::string_view text, LongPressOptions base) -> LP::Expected<LongPressOptions> {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(LP::Error{LP::Error::Code::MalformedInput, "long press options are not valid JSON"});
    }
    if (!payload.is_object()) {
        return std::unexpected(LP::Error{LP::Error::Code::InvalidType, "long press options must be a JSON object"});
    }

    auto options = std::move(base);
    if (auto it = payload.find("name"); it != payload.end()) {
        if (!it->is_string()) {
            return std::unexpected(type_error("name", "a string"));
        }
        options.name = it->get<std::string>();
    }
    if (auto it = payload.find("long_press_enabled"); it != payload.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(type_error("long_press_enabled", "a boolean"));
        }
        options.long_press_enabled = it->get<bool>();
    }
    if (auto it = payload.find("hold_seconds"); it != payload.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(type_error("hold_seconds", "an integer"));
        }
        auto const out_of_range = LP::Error{LP::Error::Code::InvalidValue, "hold_seconds is out of range"};
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                return std::unexpected(out_of_range);
            }
            options.hold_seconds = static_cast<int>(value);
        } else {
            auto value = it->get<std::int64_t>();
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                return std::unexpected(out_of_range);
            }
            options.hold_seconds = static_cast<int>(value);
        }
    }
    if (auto it = payload.find("click_mode"); it != payload.end()) {
        if (!it->is_string()) {
            return std::unexpected(type_error("click_mode", "a string"));
        }
        auto mode = parse_click_mode(it->get<std::string>());
        if (!mode) {
            return std::unexpected(LP::Error{LP::Error::Code::InvalidValue,
                                             "click_mode must be \"press\" or \"release\""});
        }
        options.click_mode = *mode;
    }
    if (auto it = payload.find("design_mode"); it != payload.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(type_error("design_mode", "a boolean"));
        }
        options.design_mode = it->get<bool>();
    }
    return options;
}

auto LongPressOptionsToJson(LongPressOptions const& options) -> std::string {
    json payload{
        {"name", options.name},
        {"long_press_enabled", options.long_press_enabled},
        {"hold_seconds", options.hold_seconds},
        {"click_mode", std::string{clickModeToString(options.click_mode)}},
        {"design_mode", options.design_mode},
    };
    // Names are not validated on input; invalid UTF-8 is replaced rather than thrown on.
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto ApplyLongPressEnvironment(LongPressOptions options) -> LP::Expected<LongPressOptions> {
    if (auto const* enabled = getenv_view(LongPressEnvironment::kEnabled)) {
        options.long_press_enabled = parse_truthy(enabled);
    }
    if (auto const* hold = getenv_view(LongPressEnvironment::kHoldSeconds)) {
        auto parsed = parse_int(hold);
        if (!parsed) {
            return std::unexpected(LP::Error{LP::Error::Code::MalformedInput,
                                             std::string{LongPressEnvironment::kHoldSeconds}
                                                 + " is not an integer: " + hold});
        }
        options.hold_seconds = *parsed;
    }
    if (auto const* design = getenv_view(LongPressEnvironment::kDesignMode)) {
        options.design_mode = parse_truthy(design);
    }
    lp_log("options after environment: " + LongPressOptionsToJson(options), "LongPressConfig");
    return options;
}

} // namespace LP::UI
