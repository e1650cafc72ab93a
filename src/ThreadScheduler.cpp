#include "motion_clip/ThreadScheduler.hpp"
#include <exception>
#include "rclcpp/rclcpp.hpp"

using namespace std::chrono;

namespace motion_clip {

ThreadScheduler::ThreadScheduler() : epoch_(steady_clock::now()) {}

void ThreadScheduler::start()
{
    if (running_.exchange(true)) return;
    worker_ = std::thread(&ThreadScheduler::loop, this);
}

void ThreadScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_ = false;
        timers_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

uint64_t ThreadScheduler::now_ms() const
{
    return duration_cast<milliseconds>(steady_clock::now() - epoch_).count();
}

TimerId ThreadScheduler::schedule_every(uint64_t period_ms, TimerFn fn)
{
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = timers_.add(now_ms() + period_ms, period_ms > 0 ? period_ms : 1, std::move(fn));
    }
    cv_.notify_all();
    return id;
}

TimerId ThreadScheduler::schedule_once(uint64_t delay_ms, TimerFn fn)
{
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = timers_.add(now_ms() + delay_ms, 0, std::move(fn));
    }
    cv_.notify_all();
    return id;
}

void ThreadScheduler::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mtx_);
    timers_.remove(id);
}

void ThreadScheduler::loop()
{
    std::unique_lock<std::mutex> lock(mtx_);
    while (running_) {
        auto due = timers_.pop_due(now_ms());
        if (!due) {
            auto next = timers_.next_due();
            if (next)
                cv_.wait_until(lock, epoch_ + milliseconds(*next));
            else
                cv_.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            due->fn();
        } catch (const std::exception& e) {
            // a throwing callback loses only its own cycle
            RCLCPP_ERROR(rclcpp::get_logger("ThreadScheduler"), "Timer %lu threw: %s",
                         static_cast<unsigned long>(due->id), e.what());
        }
        lock.lock();
    }
}

} // namespace motion_clip
