#include <doctest/doctest.h>

#include <longpress/runtime/IntervalTimer.hpp>

#include <chrono>
#include <memory>

using namespace std::chrono_literals;
using namespace LP::Runtime;

TEST_SUITE("runtime.interval_timer") {

TEST_CASE("loop timer ticks once per interval while running") {
    EventLoop loop{EventLoopOptions{.manual_clock = true}};
    auto      timer = MakeLoopIntervalTimer(loop);
    int       ticks = 0;
    timer->set_tick_handler([&] { ++ticks; });

    CHECK(timer->interval() == 1s);
    CHECK_FALSE(timer->is_running());
    REQUIRE(timer->start().has_value());
    CHECK(timer->is_running());
    CHECK(loop.active_timer_count() == 1);

    REQUIRE(loop.advance_by(2500ms).has_value());
    CHECK(ticks == 2);

    timer->stop();
    CHECK_FALSE(timer->is_running());
    CHECK(loop.active_timer_count() == 0);

    REQUIRE(loop.advance_by(5s).has_value());
    CHECK(ticks == 2);
}

TEST_CASE("start and stop are idempotent") {
    EventLoop         loop{EventLoopOptions{.manual_clock = true}};
    LoopIntervalTimer timer{loop, 1s};
    int               ticks = 0;
    timer.set_tick_handler([&] { ++ticks; });

    timer.stop();
    CHECK_FALSE(timer.is_running());

    REQUIRE(timer.start().has_value());
    REQUIRE(timer.start().has_value());
    CHECK(loop.active_timer_count() == 1);

    // A second start must not reset the phase of the running timer.
    REQUIRE(loop.advance_by(600ms).has_value());
    REQUIRE(timer.start().has_value());
    REQUIRE(loop.advance_by(400ms).has_value());
    CHECK(ticks == 1);

    timer.stop();
    timer.stop();
    CHECK(loop.active_timer_count() == 0);
}

TEST_CASE("restart begins a fresh interval") {
    EventLoop         loop{EventLoopOptions{.manual_clock = true}};
    LoopIntervalTimer timer{loop, 1s};
    int               ticks = 0;
    timer.set_tick_handler([&] { ++ticks; });

    REQUIRE(timer.start().has_value());
    REQUIRE(loop.advance_by(900ms).has_value());
    timer.stop();
    REQUIRE(timer.start().has_value());
    REQUIRE(loop.advance_by(900ms).has_value());
    CHECK(ticks == 0);
    REQUIRE(loop.advance_by(100ms).has_value());
    CHECK(ticks == 1);
}

TEST_CASE("handler may stop the timer from inside a tick") {
    EventLoop         loop{EventLoopOptions{.manual_clock = true}};
    LoopIntervalTimer timer{loop, 1s};
    int               ticks = 0;
    timer.set_tick_handler([&] {
        if (++ticks == 3) {
            timer.stop();
        }
    });

    REQUIRE(timer.start().has_value());
    REQUIRE(loop.advance_by(10s).has_value());
    CHECK(ticks == 3);
    CHECK_FALSE(timer.is_running());
}

TEST_CASE("set_interval applies at the next start") {
    EventLoop         loop{EventLoopOptions{.manual_clock = true}};
    LoopIntervalTimer timer{loop, 1s};
    int               ticks = 0;
    timer.set_tick_handler([&] { ++ticks; });

    timer.set_interval(250ms);
    CHECK(timer.interval() == 250ms);
    REQUIRE(timer.start().has_value());
    REQUIRE(loop.advance_by(1s).has_value());
    CHECK(ticks == 4);
}

TEST_CASE("a non-positive interval fails to start") {
    EventLoop         loop{EventLoopOptions{.manual_clock = true}};
    LoopIntervalTimer timer{loop, 0s};

    auto started = timer.start();
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code == LP::Error::Code::InvalidValue);
    CHECK_FALSE(timer.is_running());
}

TEST_CASE("destroying a running timer cancels its loop registration") {
    EventLoop loop{EventLoopOptions{.manual_clock = true}};
    int       ticks = 0;
    {
        auto timer = MakeLoopIntervalTimer(loop, 1s);
        timer->set_tick_handler([&] { ++ticks; });
        REQUIRE(timer->start().has_value());
        CHECK(loop.active_timer_count() == 1);
    }
    CHECK(loop.active_timer_count() == 0);
    REQUIRE(loop.advance_by(3s).has_value());
    CHECK(ticks == 0);
}

} // TEST_SUITE
