#pragma once

#include <longpress/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>

namespace LP::Runtime {

using Clock   = std::chrono::steady_clock;
using TimerId = std::uint64_t;

struct EventLoopOptions {
    // Manual clock: time only moves through advance_by()/run_for(). Used by tests
    // and replay tooling so countdowns are deterministic.
    bool                      manual_clock = false;
    Clock::time_point         start_time{};
    std::chrono::milliseconds idle_sleep{std::chrono::milliseconds{1}};
};

/**
 * EventLoop: single-threaded cooperative dispatcher.
 *
 * Notes:
 * - Every method must be called from the thread that drives the loop; there is
 *   no internal locking.
 * - Timers fire in due-time order, ties broken by creation order.
 * - Callbacks may post tasks, schedule timers, or cancel any timer including
 *   the one currently firing; a repeating timer cancelled from its own callback
 *   never fires again.
 */
class EventLoop {
public:
    using Task = std::function<void()>;

    explicit EventLoop(EventLoopOptions options = {});

    EventLoop(EventLoop const&)            = delete;
    EventLoop& operator=(EventLoop const&) = delete;

    [[nodiscard]] auto now() const -> Clock::time_point;
    [[nodiscard]] auto uses_manual_clock() const -> bool { return options_.manual_clock; }

    auto post(Task task) -> void;

    // Interval must be positive (InvalidValue otherwise).
    auto schedule_repeating(Clock::duration interval, Task task) -> Expected<TimerId>;
    auto schedule_once(Clock::duration delay, Task task) -> TimerId;
    auto cancel(TimerId id) -> bool;

    [[nodiscard]] auto is_scheduled(TimerId id) const -> bool;
    [[nodiscard]] auto active_timer_count() const -> std::size_t { return timers_.size(); }
    [[nodiscard]] auto pending_task_count() const -> std::size_t { return tasks_.size(); }

    // Runs posted tasks (including tasks posted while draining). Returns the count.
    auto run_pending() -> std::size_t;

    // Manual clock only: moves virtual time forward, firing due timers in order.
    // Returns the number of timer callbacks invoked.
    auto advance_by(Clock::duration delta) -> Expected<std::size_t>;

    // Real clock: dispatches tasks and timers until the duration elapsed or stop()
    // was called. Manual clock: equivalent to advance_by(duration).
    auto run_for(Clock::duration duration) -> Expected<std::size_t>;

    auto stop() -> void { stop_requested_ = true; }

private:
    struct TimerEntry {
        Clock::time_point due;
        Clock::duration   interval{};
        bool              repeating = false;
        Task              task;
    };

    auto schedule(Clock::duration delay, Clock::duration interval, bool repeating, Task task) -> TimerId;
    auto next_due_timer(Clock::time_point limit) const -> std::map<TimerId, TimerEntry>::const_iterator;
    auto fire_due_timers(Clock::time_point limit) -> std::size_t;

    EventLoopOptions                options_;
    Clock::time_point               manual_now_;
    std::deque<Task>                tasks_;
    std::map<TimerId, TimerEntry>   timers_;
    TimerId                         next_timer_id_ = 1;
    bool                            stop_requested_ = false;
};

} // namespace LP::Runtime
