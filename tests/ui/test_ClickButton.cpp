#include <doctest/doctest.h>

#include "ui/LongPressTestUtils.hpp"

#include <longpress/ui/ClickButton.hpp>

using namespace LongPressTestUtils;
using LP::UI::ActivationSource;
using LP::UI::ClickButton;
using LP::UI::ClickMode;

TEST_SUITE("ui.click_button") {

TEST_CASE("release mode activates on primary release over the button") {
    ClickButton button{"ok"};
    Recorder    recorder{button};
    attach(button);

    auto down = pointer();
    button.pointer_down(down);
    CHECK(button.is_pressed());
    CHECK(recorder.activations.empty());

    auto up = pointer();
    button.pointer_up(up);
    CHECK_FALSE(button.is_pressed());
    REQUIRE(recorder.activations.size() == 1);
    CHECK(recorder.activations[0].source == ActivationSource::Pointer);
    CHECK(recorder.activations[0].pointer == up);
}

TEST_CASE("release mode does not activate when released outside") {
    ClickButton button{"ok"};
    Recorder    recorder{button};
    attach(button);

    button.pointer_down(pointer());
    button.pointer_leave(pointer());
    CHECK_FALSE(button.is_pressed());
    button.pointer_up(pointer());
    CHECK(recorder.activations.empty());

    SUBCASE("re-entering before release restores the press") {
        button.pointer_down(pointer());
        button.pointer_leave(pointer());
        button.pointer_enter(pointer());
        CHECK(button.is_pressed());
        button.pointer_up(pointer());
        CHECK(recorder.activations.size() == 1);
    }
}

TEST_CASE("press mode activates on primary press with the press event") {
    ClickButton button{"ok", ClickMode::Press};
    Recorder    recorder{button};
    attach(button);

    auto down = pointer();
    button.pointer_down(down);
    REQUIRE(recorder.activations.size() == 1);
    CHECK(recorder.activations[0].pointer == down);

    button.pointer_up(pointer());
    CHECK(recorder.activations.size() == 1);
    CHECK(button.activation_count() == 1);
}

TEST_CASE("secondary pointer buttons never activate") {
    ClickButton button{"ok", ClickMode::Press};
    Recorder    recorder{button};
    attach(button);

    button.pointer_down(pointer(PointerButton::Secondary));
    button.pointer_up(pointer(PointerButton::Secondary));
    CHECK_FALSE(button.is_pressed());
    CHECK(recorder.activations.empty());
}

TEST_CASE("space activates on key-up in release mode and key-down in press mode") {
    SUBCASE("release") {
        ClickButton button{"ok"};
        Recorder    recorder{button};
        attach(button);

        button.key_down(key_down(Key::Space));
        CHECK(button.is_pressed());
        CHECK(recorder.activations.empty());
        auto up = key_up(Key::Space);
        button.key_up(up);
        REQUIRE(recorder.activations.size() == 1);
        CHECK(recorder.activations[0].source == ActivationSource::SpaceKey);
        CHECK(recorder.activations[0].key == up);
    }
    SUBCASE("press") {
        ClickButton button{"ok", ClickMode::Press};
        Recorder    recorder{button};
        attach(button);

        auto down = key_down(Key::Space);
        button.key_down(down);
        button.key_down(key_down(Key::Space, ButtonModifiers::None, true));
        button.key_up(key_up(Key::Space));
        REQUIRE(recorder.activations.size() == 1);
        CHECK(recorder.activations[0].key == down);
    }
}

TEST_CASE("enter activates on every key-down in both modes") {
    for (auto mode : {ClickMode::Release, ClickMode::Press}) {
        ClickButton button{"ok", mode};
        Recorder    recorder{button};
        attach(button);

        button.key_down(key_down(Key::Enter));
        button.key_down(key_down(Key::Enter));
        button.key_up(key_up(Key::Enter));
        REQUIRE(recorder.activations.size() == 2);
        CHECK(recorder.activations[1].source == ActivationSource::EnterKey);
    }
}

TEST_CASE("alt+space is left to the system menu") {
    ClickButton button{"ok", ClickMode::Press};
    Recorder    recorder{button};
    attach(button);

    button.key_down(key_down(Key::Space, ButtonModifiers::Alt));
    CHECK_FALSE(button.is_pressed());
    CHECK(recorder.activations.empty());

    // Control+Alt+Space is an ordinary press.
    button.key_down(key_down(Key::Space, ButtonModifiers::Alt | ButtonModifiers::Control));
    CHECK(recorder.activations.size() == 1);
}

TEST_CASE("keys need keyboard focus") {
    ClickButton button{"ok", ClickMode::Press};
    Recorder    recorder{button};
    button.mount();

    button.key_down(key_down(Key::Enter));
    CHECK(recorder.activations.empty());

    REQUIRE(button.focus());
    button.key_down(key_down(Key::Enter));
    CHECK(recorder.activations.size() == 1);
}

TEST_CASE("losing focus releases a held space without activating") {
    ClickButton button{"ok"};
    Recorder    recorder{button};
    attach(button);

    button.key_down(key_down(Key::Space));
    button.lose_keyboard_focus();
    CHECK_FALSE(button.is_pressed());
    CHECK_FALSE(button.state().focused);

    REQUIRE(button.focus());
    button.key_up(key_up(Key::Space));
    CHECK(recorder.activations.empty());
}

TEST_CASE("disabled or unmounted buttons ignore input") {
    ClickButton button{"ok", ClickMode::Press};
    Recorder    recorder{button};

    button.pointer_down(pointer());
    CHECK_FALSE(button.click());

    attach(button);
    button.set_enabled(false);
    CHECK_FALSE(button.state().enabled);
    CHECK_FALSE(button.has_keyboard_focus());
    CHECK_FALSE(button.focus());
    button.pointer_down(pointer());
    CHECK_FALSE(button.click());
    CHECK(recorder.activations.empty());

    button.set_enabled(true);
    CHECK(button.click());
    REQUIRE(recorder.activations.size() == 1);
    CHECK(recorder.activations[0].source == ActivationSource::Programmatic);
}

TEST_CASE("disabling mid-press clears the pressed state") {
    ClickButton button{"ok"};
    Recorder    recorder{button};
    attach(button);

    button.pointer_down(pointer());
    button.set_enabled(false);
    CHECK_FALSE(button.is_pressed());
    button.set_enabled(true);
    button.pointer_up(pointer());
    CHECK(recorder.activations.empty());
}

TEST_CASE("unmount drops focus and hover") {
    ClickButton button{"ok"};
    int         unloaded = 0;
    button.unloaded.connect([&] { ++unloaded; });
    attach(button);
    CHECK(button.state().hovered);

    button.unmount();
    CHECK_FALSE(button.is_mounted());
    CHECK_FALSE(button.has_keyboard_focus());
    CHECK_FALSE(button.is_pointer_over());
    button.unmount();
    CHECK(unloaded == 1);
}

} // TEST_SUITE
