#include <longpress/core/Error.hpp>
#include <longpress/io/IoEvents.hpp>
#include <longpress/runtime/EventLoop.hpp>
#include <longpress/ui/LongPressButton.hpp>
#include <longpress/ui/LongPressConfig.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace LP::UI;
using namespace std::chrono_literals;

namespace {

auto make_pointer() -> LP::IO::PointerEventPtr {
    return std::make_shared<LP::IO::PointerEvent const>(LP::IO::PointerEvent{
        .device_path = "/system/devices/in/pointer/default",
        .pointer_id  = 1,
        .x           = 40.0f,
        .y           = 16.0f,
    });
}

auto source_label(ActivationSource source) -> std::string_view {
    switch (source) {
    case ActivationSource::Pointer:
        return "pointer";
    case ActivationSource::SpaceKey:
        return "space";
    case ActivationSource::EnterKey:
        return "enter";
    case ActivationSource::Programmatic:
        return "programmatic";
    }
    return "unknown";
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> options_json;
    bool                       dump_json = false;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--options" && idx + 1 < argc) {
            options_json = argv[++idx];
        } else if (arg == "--dump_json") {
            dump_json = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--options <json>] [--dump_json]\n";
            return 1;
        }
    }

    LongPressOptions options{.name = "delete_everything"};
    if (options_json) {
        auto parsed = ParseLongPressOptions(*options_json, options);
        if (!parsed) {
            std::cerr << "Invalid --options: " << LP::describeError(parsed.error()) << '\n';
            return 1;
        }
        options = *parsed;
    }
    auto configured = ApplyLongPressEnvironment(options);
    if (!configured) {
        std::cerr << "Invalid environment: " << LP::describeError(configured.error()) << '\n';
        return 1;
    }
    options = *configured;

    if (dump_json) {
        std::cout << LongPressOptionsToJson(options) << '\n';
        return 0;
    }

    LP::Runtime::EventLoop loop;
    LongPressButton        button{loop, options};
    auto const             started = loop.now();

    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(loop.now() - started).count();
    };

    button.left_seconds_property().observe([&](std::optional<int> const&, std::optional<int> const& current) {
        if (current) {
            std::cout << "  [" << elapsed() << "ms] LeftSeconds = " << *current << '\n';
        } else {
            std::cout << "  [" << elapsed() << "ms] LeftSeconds cleared\n";
        }
    });
    button.activated.connect([&](ActivationEvent const& event) {
        std::cout << "  [" << elapsed() << "ms] activated by " << source_label(event.source) << '\n';
    });

    button.mount();
    button.pointer_enter(make_pointer());

    auto const hold = std::chrono::seconds{std::max(button.hold_seconds(), 0)};

    std::cout << button.name() << ": press and hold for " << hold.count() << "s\n";
    button.pointer_down(make_pointer());
    if (auto ran = loop.run_for(hold + 200ms); !ran) {
        std::cerr << "Event loop failed: " << LP::describeError(ran.error()) << '\n';
        return 1;
    }
    button.pointer_up(make_pointer());

    std::cout << button.name() << ": press and release early\n";
    button.pointer_down(make_pointer());
    if (auto ran = loop.run_for(hold / 2 + 100ms); !ran) {
        std::cerr << "Event loop failed: " << LP::describeError(ran.error()) << '\n';
        return 1;
    }
    button.pointer_up(make_pointer());
    if (auto ran = loop.run_for(hold); !ran) {
        std::cerr << "Event loop failed: " << LP::describeError(ran.error()) << '\n';
        return 1;
    }

    button.unmount();
    std::cout << button.name() << ": " << button.activation_count() << " activation(s)\n";
    return 0;
}
