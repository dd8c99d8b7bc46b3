#include <longpress/runtime/IntervalTimer.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace LP::Runtime {

LoopIntervalTimer::LoopIntervalTimer(EventLoop& loop, Clock::duration interval)
    : loop_(loop), interval_(interval) {}

LoopIntervalTimer::~LoopIntervalTimer() {
    stop();
}

auto LoopIntervalTimer::start() -> Expected<void> {
    if (timer_id_) {
        return {};
    }
    auto scheduled = loop_.schedule_repeating(interval_, [this] { this->dispatch_tick(); });
    if (!scheduled) {
        lp_log("interval timer failed to start: " + describeError(scheduled.error()), "IntervalTimer", "ERROR");
        return std::unexpected(scheduled.error());
    }
    timer_id_ = *scheduled;
    return {};
}

auto LoopIntervalTimer::stop() -> void {
    if (!timer_id_) {
        return;
    }
    loop_.cancel(*timer_id_);
    timer_id_.reset();
}

auto LoopIntervalTimer::dispatch_tick() -> void {
    if (handler_) {
        handler_();
    }
}

auto MakeLoopIntervalTimer(EventLoop& loop, Clock::duration interval) -> std::unique_ptr<IntervalTimer> {
    return std::make_unique<LoopIntervalTimer>(loop, interval);
}

} // namespace LP::Runtime
