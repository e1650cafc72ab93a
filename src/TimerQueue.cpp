#include "motion_clip/TimerQueue.hpp"

namespace motion_clip {

TimerId TimerQueue::add(uint64_t at_ms, uint64_t period_ms, TimerFn fn)
{
    const TimerId id = next_id_++;
    timers_.emplace(id, Timer{at_ms, period_ms, std::move(fn)});
    return id;
}

bool TimerQueue::remove(TimerId id)
{
    return timers_.erase(id) > 0;
}

std::map<TimerId, TimerQueue::Timer>::iterator TimerQueue::earliest()
{
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        // strict '<' keeps the lower id (older registration) on ties
        if (best == timers_.end() || it->second.at_ms < best->second.at_ms) best = it;
    }
    return best;
}

std::map<TimerId, TimerQueue::Timer>::const_iterator TimerQueue::earliest() const
{
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (best == timers_.end() || it->second.at_ms < best->second.at_ms) best = it;
    }
    return best;
}

std::optional<uint64_t> TimerQueue::next_due() const
{
    auto it = earliest();
    if (it == timers_.end()) return std::nullopt;
    return it->second.at_ms;
}

std::optional<TimerQueue::Due> TimerQueue::pop_due(uint64_t now_ms)
{
    auto it = earliest();
    if (it == timers_.end() || it->second.at_ms > now_ms) return std::nullopt;

    Due due{it->first, it->second.at_ms, it->second.fn};
    if (it->second.period_ms > 0)
        it->second.at_ms += it->second.period_ms;
    else
        timers_.erase(it);
    return due;
}

} // namespace motion_clip
