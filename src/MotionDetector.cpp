#include "motion_clip/MotionDetector.hpp"
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

MotionDetector::MotionDetector(std::shared_ptr<FrameSource> source, bool is_local,
                               const DetectorConfig& cfg, MotionCallback on_motion)
    : source_(std::move(source)), is_local_(is_local), cfg_(cfg), on_motion_(std::move(on_motion))
{
    if (!source_) throw std::invalid_argument("MotionDetector: null frame source");
    validate(cfg_);
}

void MotionDetector::start(Scheduler& scheduler)
{
    stop();
    scheduler_ = &scheduler;
    timer_ = scheduler.schedule_every(cfg_.sample_interval_ms, [this] { tick(); });
    RCLCPP_INFO(rclcpp::get_logger("MotionDetector"),
                "Sampling %s every %d ms at %dx%d (threshold %lu)",
                source_->name().c_str(), cfg_.sample_interval_ms, cfg_.width, cfg_.height,
                static_cast<unsigned long>(cfg_.diff_threshold));
}

void MotionDetector::stop()
{
    if (scheduler_) scheduler_->cancel(timer_);
    scheduler_ = nullptr;
    timer_ = 0;
}

std::optional<uint64_t> MotionDetector::tick()
{
    auto frame = source_->current_frame();
    if (!frame || frame->empty()) {
        RCLCPP_DEBUG(rclcpp::get_logger("MotionDetector"), "%s: no frame this cycle",
                     source_->name().c_str());
        return std::nullopt;
    }

    cv::Mat sample = resample(frame->pixels);

    bool fire = false;
    uint64_t diff = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (previous_.empty()) {
            previous_ = std::move(sample);
            return std::nullopt;
        }
        diff = difference(sample, previous_);
        previous_ = std::move(sample);

        if (diff > cfg_.diff_threshold && state_ == DetectionState::Idle) {
            state_ = DetectionState::Triggered;
            fire = true;
        }
    }

    if (fire) {
        RCLCPP_INFO(rclcpp::get_logger("MotionDetector"), "Motion detected for %s user (%s, diff %lu)",
                    is_local_ ? "local" : "remote", source_->name().c_str(),
                    static_cast<unsigned long>(diff));
        if (on_motion_) on_motion_(is_local_);
    }
    return diff;
}

void MotionDetector::reset_latch()
{
    std::lock_guard<std::mutex> lock(mtx_);
    state_ = DetectionState::Idle;
}

DetectionState MotionDetector::state() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

cv::Mat MotionDetector::resample(const cv::Mat& frame) const
{
    cv::Mat bgra;
    if (frame.type() == CV_8UC4)
        bgra = frame;
    else if (frame.type() == CV_8UC3)
        cv::cvtColor(frame, bgra, cv::COLOR_BGR2BGRA);
    else if (frame.type() == CV_8UC1)
        cv::cvtColor(frame, bgra, cv::COLOR_GRAY2BGRA);
    else
        throw std::invalid_argument("MotionDetector: unsupported frame type");

    if (bgra.cols == cfg_.width && bgra.rows == cfg_.height) return bgra.clone();

    cv::Mat out;
    cv::resize(bgra, out, cv::Size(cfg_.width, cfg_.height), 0, 0, cv::INTER_LINEAR);
    return out;
}

uint64_t MotionDetector::difference(const cv::Mat& a, const cv::Mat& b)
{
    CV_Assert(a.type() == CV_8UC4 && b.type() == CV_8UC4 && a.size() == b.size());
    cv::Mat d;
    cv::absdiff(a, b, d);
    const cv::Scalar s = cv::sum(d);
    // channel sums are exact integers well inside double's 53-bit mantissa
    return static_cast<uint64_t>(s[0]) + static_cast<uint64_t>(s[1]) + static_cast<uint64_t>(s[2]);
}

} // namespace motion_clip
