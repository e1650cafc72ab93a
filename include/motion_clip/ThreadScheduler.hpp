#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "motion_clip/Scheduler.hpp"
#include "motion_clip/TimerQueue.hpp"

namespace motion_clip {

/**
 * @brief Wall-clock scheduler running every callback on one worker thread.
 */
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override { stop(); }

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    void start();
    /// Joins the worker; timers still pending are dropped.
    void stop();

    uint64_t now_ms() const override;
    TimerId schedule_every(uint64_t period_ms, TimerFn fn) override;
    TimerId schedule_once(uint64_t delay_ms, TimerFn fn) override;
    void cancel(TimerId id) override;

private:
    void loop();

    const std::chrono::steady_clock::time_point epoch_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    std::mutex mtx_;
    std::condition_variable cv_;
    TimerQueue timers_;
};

} // namespace motion_clip
