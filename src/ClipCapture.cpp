#include "motion_clip/ClipCapture.hpp"
#include <algorithm>
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

ClipCapture::ClipCapture(const RecorderConfig& cfg) : cfg_(cfg)
{
    validate(cfg_);
}

bool ClipCapture::begin(std::shared_ptr<FrameSource> source, Scheduler& scheduler,
                        ChunkFn on_chunk, StoppedFn on_stopped)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (running_ || !source) return false;
        source_ = std::move(source);
        scheduler_ = &scheduler;
        on_chunk_ = std::move(on_chunk);
        on_stopped_ = std::move(on_stopped);
        start_ms_ = scheduler.now_ms();
        running_ = true;
        failed_ = false;
        frames_ = 0;
    }

    grab();
    const uint64_t period = std::max(1, 1000 / cfg_.capture_fps);
    TimerId id = scheduler.schedule_every(period, [this] { grab(); });

    std::lock_guard<std::mutex> lock(mtx_);
    if (running_)
        timer_ = id;
    else
        scheduler.cancel(id);
    return true;
}

void ClipCapture::grab()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_ || failed_) return;

    auto frame = source_->current_frame();
    if (!frame || frame->empty()) return;  // the source dictates drops

    if (!writer_.is_open()) {
        // Clip geometry follows the first frame we get.
        if (!writer_.open(frame->width(), frame->height(), cfg_, on_chunk_)) {
            RCLCPP_ERROR(rclcpp::get_logger("ClipCapture"), "Could not start %s/%s clip for %s",
                         cfg_.container.c_str(), cfg_.codec.c_str(), source_->name().c_str());
            failed_ = true;
            return;
        }
    }

    const int64_t pts_ms = static_cast<int64_t>(scheduler_->now_ms() - start_ms_);
    if (!writer_.write_frame(frame->pixels, pts_ms)) {
        RCLCPP_WARN(rclcpp::get_logger("ClipCapture"), "Dropped frame at %ld ms", static_cast<long>(pts_ms));
        return;
    }
    ++frames_;
}

void ClipCapture::stop()
{
    StoppedFn stopped;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
        if (scheduler_ && timer_) scheduler_->cancel(timer_);
        timer_ = 0;

        if (writer_.is_open() && !writer_.close())
            RCLCPP_WARN(rclcpp::get_logger("ClipCapture"), "Clip trailer was not written cleanly");
        stopped = std::move(on_stopped_);
        on_stopped_ = nullptr;
        on_chunk_ = nullptr;
        source_.reset();
    }
    if (stopped) stopped();
}

void ClipCapture::abort()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (scheduler_ && timer_) scheduler_->cancel(timer_);
    timer_ = 0;
    running_ = false;
    writer_.abort();
    on_stopped_ = nullptr;
    on_chunk_ = nullptr;
    source_.reset();
}

int64_t ClipCapture::frames_captured() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return frames_;
}

} // namespace motion_clip
