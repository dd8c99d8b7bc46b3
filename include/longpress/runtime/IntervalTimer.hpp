#pragma once

#include <longpress/core/Error.hpp>
#include <longpress/runtime/EventLoop.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace LP::Runtime {

/**
 * IntervalTimer: recurring tick source consumed by controls.
 *
 * start() on a running timer and stop() on a stopped timer are no-ops.
 * Implementations stop themselves on destruction so no tick can reach a
 * destroyed owner.
 */
class IntervalTimer {
public:
    using TickHandler = std::function<void()>;

    virtual ~IntervalTimer() = default;

    virtual auto start() -> Expected<void> = 0;
    virtual auto stop() -> void            = 0;

    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    // Takes effect at the next start().
    virtual auto set_interval(Clock::duration interval) -> void = 0;
    [[nodiscard]] virtual auto interval() const -> Clock::duration = 0;

    virtual auto set_tick_handler(TickHandler handler) -> void = 0;
};

class LoopIntervalTimer final : public IntervalTimer {
public:
    explicit LoopIntervalTimer(EventLoop& loop, Clock::duration interval = std::chrono::seconds{1});
    ~LoopIntervalTimer() override;

    LoopIntervalTimer(LoopIntervalTimer const&)            = delete;
    LoopIntervalTimer& operator=(LoopIntervalTimer const&) = delete;

    auto start() -> Expected<void> override;
    auto stop() -> void override;

    [[nodiscard]] auto is_running() const -> bool override { return timer_id_.has_value(); }

    auto set_interval(Clock::duration interval) -> void override { interval_ = interval; }
    [[nodiscard]] auto interval() const -> Clock::duration override { return interval_; }

    auto set_tick_handler(TickHandler handler) -> void override { handler_ = std::move(handler); }

private:
    auto dispatch_tick() -> void;

    EventLoop&             loop_;
    Clock::duration        interval_;
    TickHandler            handler_;
    std::optional<TimerId> timer_id_;
};

[[nodiscard]] auto MakeLoopIntervalTimer(EventLoop& loop,
                                         Clock::duration interval = std::chrono::seconds{1})
    -> std::unique_ptr<IntervalTimer>;

} // namespace LP::Runtime
