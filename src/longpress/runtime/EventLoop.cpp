#include <longpress/runtime/EventLoop.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace LP::Runtime {

EventLoop::EventLoop(EventLoopOptions options)
    : options_(std::move(options))
    , manual_now_(options_.start_time) {}

auto EventLoop::now() const -> Clock::time_point {
    if (options_.manual_clock) {
        return manual_now_;
    }
    return Clock::now();
}

auto EventLoop::post(Task task) -> void {
    if (!task) {
        return;
    }
    tasks_.push_back(std::move(task));
}

auto EventLoop::schedule(Clock::duration delay, Clock::duration interval, bool repeating, Task task) -> TimerId {
    auto id = next_timer_id_++;
    timers_.emplace(id, TimerEntry{.due = now() + std::max(delay, Clock::duration::zero()),
                                   .interval = interval,
                                   .repeating = repeating,
                                   .task = std::move(task)});
    return id;
}

auto EventLoop::schedule_repeating(Clock::duration interval, Task task) -> Expected<TimerId> {
    if (interval <= Clock::duration::zero()) {
        return std::unexpected(Error{Error::Code::InvalidValue, "repeating timer interval must be positive"});
    }
    return schedule(interval, interval, true, std::move(task));
}

auto EventLoop::schedule_once(Clock::duration delay, Task task) -> TimerId {
    return schedule(delay, Clock::duration::zero(), false, std::move(task));
}

auto EventLoop::cancel(TimerId id) -> bool {
    return timers_.erase(id) > 0;
}

auto EventLoop::is_scheduled(TimerId id) const -> bool {
    return timers_.contains(id);
}

auto EventLoop::run_pending() -> std::size_t {
    std::size_t ran = 0;
    while (!tasks_.empty()) {
        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        task();
        ++ran;
    }
    return ran;
}

auto EventLoop::next_due_timer(Clock::time_point limit) const -> std::map<TimerId, TimerEntry>::const_iterator {
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due > limit) {
            continue;
        }
        if (best == timers_.end() || it->second.due < best->second.due) {
            best = it;
        }
    }
    return best;
}

auto EventLoop::fire_due_timers(Clock::time_point limit) -> std::size_t {
    std::size_t fired = 0;
    while (!stop_requested_) {
        auto it = next_due_timer(limit);
        if (it == timers_.end()) {
            break;
        }
        auto id   = it->first;
        auto task = it->second.task;
        if (options_.manual_clock) {
            manual_now_ = it->second.due;
        }
        if (it->second.repeating) {
            timers_.at(id).due += it->second.interval;
        } else {
            timers_.erase(it);
        }
        ++fired;
        if (task) {
            task();
        }
        run_pending();
    }
    return fired;
}

auto EventLoop::advance_by(Clock::duration delta) -> Expected<std::size_t> {
    if (!options_.manual_clock) {
        return std::unexpected(Error{Error::Code::NotSupported, "advance_by requires a manual clock"});
    }
    if (delta < Clock::duration::zero()) {
        return std::unexpected(Error{Error::Code::InvalidValue, "cannot move the clock backwards"});
    }
    stop_requested_ = false;
    auto target = manual_now_ + delta;
    run_pending();
    auto fired = fire_due_timers(target);
    if (!stop_requested_) {
        manual_now_ = target;
    }
    return fired;
}

auto EventLoop::run_for(Clock::duration duration) -> Expected<std::size_t> {
    if (options_.manual_clock) {
        return advance_by(duration);
    }
    stop_requested_ = false;
    auto const  deadline = Clock::now() + duration;
    std::size_t fired    = 0;
    while (!stop_requested_) {
        run_pending();
        fired += fire_due_timers(Clock::now());
        auto current = Clock::now();
        if (stop_requested_ || current >= deadline) {
            break;
        }
        auto wake = std::min(deadline, current + options_.idle_sleep);
        for (auto const& timer : timers_) {
            wake = std::min(wake, timer.second.due);
        }
        if (tasks_.empty() && wake > current) {
            std::this_thread::sleep_until(wake);
        }
    }
    lp_log("run_for dispatched " + std::to_string(fired) + " timer callbacks", "EventLoop");
    return fired;
}

} // namespace LP::Runtime
