#pragma once
#include <mutex>
#include "motion_clip/Scheduler.hpp"
#include "motion_clip/TimerQueue.hpp"

namespace motion_clip {

/**
 * @brief Simulated clock; time only moves inside advance().
 */
class ManualScheduler : public Scheduler {
public:
    uint64_t now_ms() const override;
    TimerId schedule_every(uint64_t period_ms, TimerFn fn) override;
    TimerId schedule_once(uint64_t delay_ms, TimerFn fn) override;
    void cancel(TimerId id) override;

    /// Fire every timer due within the next `ms`, in order, then settle the
    /// clock at now + ms. Returns the number of callbacks run.
    size_t advance(uint64_t ms);

    bool idle() const;

private:
    mutable std::mutex mtx_;
    uint64_t now_ms_ = 0;
    TimerQueue timers_;
};

} // namespace motion_clip
