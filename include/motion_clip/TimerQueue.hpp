#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include "motion_clip/Scheduler.hpp"

namespace motion_clip {

/**
 * @brief Ordered set of pending timers shared by the scheduler backends.
 *
 * Not thread-safe; the owning scheduler serializes access.
 */
class TimerQueue {
public:
    struct Due {
        TimerId id;
        uint64_t at_ms;
        TimerFn fn;
    };

    TimerId add(uint64_t at_ms, uint64_t period_ms, TimerFn fn);
    bool remove(TimerId id);
    void clear() { timers_.clear(); }
    bool empty() const { return timers_.empty(); }

    std::optional<uint64_t> next_due() const;

    /// Take the earliest timer due at or before `now_ms`. Periodic timers are
    /// re-armed one period later, one-shots are removed.
    std::optional<Due> pop_due(uint64_t now_ms);

private:
    struct Timer {
        uint64_t at_ms;
        uint64_t period_ms;  // 0 = one-shot
        TimerFn fn;
    };

    std::map<TimerId, Timer>::iterator earliest();
    std::map<TimerId, Timer>::const_iterator earliest() const;

    std::map<TimerId, Timer> timers_;  // keyed by registration order
    TimerId next_id_ = 1;
};

} // namespace motion_clip
