#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>

namespace motion_clip {

// FIFO for a single consumer thread. pop() blocks until an element arrives or
// stop() is called; after stop() the remaining elements are still handed out.
template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    // Returns false (and drops the element) once stopped.
    bool push(T&& v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) return false;
            q_.emplace_back(std::move(v));
        }
        cv_.notify_one();
        return true;
    }

    // False when stopped and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return stop_ || !q_.empty(); });

        if (stop_ && q_.empty()) return false;

        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool stop_ = false;
};

} // namespace motion_clip
