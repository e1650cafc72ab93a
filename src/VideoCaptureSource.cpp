#include "motion_clip/VideoCaptureSource.hpp"
#include <chrono>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "rclcpp/rclcpp.hpp"

using namespace std::chrono;

namespace motion_clip {

VideoCaptureSource VideoCaptureSource::camera(int device_index)
{
    return VideoCaptureSource(device_index, "", "camera:" + std::to_string(device_index));
}

VideoCaptureSource VideoCaptureSource::stream(const std::string& url)
{
    return VideoCaptureSource(-1, url, url);
}

VideoCaptureSource::VideoCaptureSource(int device_index, std::string url, std::string name)
    : device_index_(device_index), url_(std::move(url)), name_(std::move(name))
{}

VideoCaptureSource::VideoCaptureSource(VideoCaptureSource&& other) noexcept
    : device_index_(other.device_index_),
      url_(std::move(other.url_)),
      name_(std::move(other.name_))
{
    // Only unopened sources are moved (factory return path).
}

void VideoCaptureSource::open()
{
    if (running_) return;

    const bool ok = url_.empty() ? cap_.open(device_index_, cv::CAP_ANY)
                                 : cap_.open(url_, cv::CAP_FFMPEG);
    if (!ok || !cap_.isOpened())
        throw std::runtime_error("VideoCaptureSource: cannot open " + name_);

    running_ = true;
    worker_ = std::thread(&VideoCaptureSource::grab_loop, this);
    RCLCPP_INFO(rclcpp::get_logger("VideoCaptureSource"), "Opened %s", name_.c_str());
}

void VideoCaptureSource::close()
{
    running_ = false;
    if (worker_.joinable()) worker_.join();
    if (cap_.isOpened()) cap_.release();

    std::lock_guard<std::mutex> lock(mtx_);
    latest_bgra_.release();
}

void VideoCaptureSource::grab_loop()
{
    cv::Mat bgr;
    while (running_) {
        if (!cap_.read(bgr) || bgr.empty()) {
            // stream stalled; keep serving the last frame we have
            std::this_thread::sleep_for(milliseconds(10));
            continue;
        }

        cv::Mat bgra;
        if (bgr.channels() == 4)
            bgra = bgr.clone();
        else if (bgr.channels() == 1)
            cv::cvtColor(bgr, bgra, cv::COLOR_GRAY2BGRA);
        else
            cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);

        const uint64_t ts = duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
        std::lock_guard<std::mutex> lock(mtx_);
        latest_bgra_ = std::move(bgra);
        latest_ts_ns_ = ts;
    }
}

std::optional<Frame> VideoCaptureSource::current_frame()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (latest_bgra_.empty()) return std::nullopt;

    Frame f;
    f.pixels = latest_bgra_.clone();
    f.timestamp_ns = latest_ts_ns_;
    return f;
}

} // namespace motion_clip
