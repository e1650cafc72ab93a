#include "motion_clip/ManualScheduler.hpp"

namespace motion_clip {

uint64_t ManualScheduler::now_ms() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return now_ms_;
}

TimerId ManualScheduler::schedule_every(uint64_t period_ms, TimerFn fn)
{
    std::lock_guard<std::mutex> lock(mtx_);
    return timers_.add(now_ms_ + period_ms, period_ms > 0 ? period_ms : 1, std::move(fn));
}

TimerId ManualScheduler::schedule_once(uint64_t delay_ms, TimerFn fn)
{
    std::lock_guard<std::mutex> lock(mtx_);
    return timers_.add(now_ms_ + delay_ms, 0, std::move(fn));
}

void ManualScheduler::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mtx_);
    timers_.remove(id);
}

size_t ManualScheduler::advance(uint64_t ms)
{
    std::unique_lock<std::mutex> lock(mtx_);
    const uint64_t target = now_ms_ + ms;
    size_t fired = 0;

    while (auto due = timers_.pop_due(target)) {
        now_ms_ = due->at_ms;
        lock.unlock();
        due->fn();
        ++fired;
        lock.lock();
    }
    now_ms_ = target;
    return fired;
}

bool ManualScheduler::idle() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return timers_.empty();
}

} // namespace motion_clip
