#pragma once
#include <cstdint>
#include <functional>

namespace motion_clip {

using TimerId = uint64_t;
using TimerFn = std::function<void()>;

/**
 * @brief Timeline for the recurring sample timer and one-shot stop timers.
 *
 * Callbacks of one scheduler never run concurrently; due timers fire in
 * due-time order, ties in registration order. Callbacks may schedule or
 * cancel other timers (including their own).
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual uint64_t now_ms() const = 0;
    virtual TimerId schedule_every(uint64_t period_ms, TimerFn fn) = 0;
    virtual TimerId schedule_once(uint64_t delay_ms, TimerFn fn) = 0;
    virtual void cancel(TimerId id) = 0;
};

} // namespace motion_clip
