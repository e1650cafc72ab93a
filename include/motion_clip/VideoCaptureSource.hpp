#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <opencv2/videoio.hpp>
#include "motion_clip/FrameSource.hpp"

namespace motion_clip {

/**
 * @brief FrameSource backed by cv::VideoCapture.
 *
 * Opens either a local camera (device index) or a network stream (URL).
 * A grab thread decodes continuously and keeps only the latest frame, so
 * current_frame() never blocks on I/O.
 */
class VideoCaptureSource : public FrameSource {
public:
    static VideoCaptureSource camera(int device_index);
    static VideoCaptureSource stream(const std::string& url);

    VideoCaptureSource(VideoCaptureSource&& other) noexcept;
    ~VideoCaptureSource() override { close(); }

    VideoCaptureSource(const VideoCaptureSource&) = delete;
    VideoCaptureSource& operator=(const VideoCaptureSource&) = delete;

    void open();   // throws std::runtime_error
    void close();
    bool is_open() const { return running_; }

    std::optional<Frame> current_frame() override;
    std::string name() const override { return name_; }

private:
    VideoCaptureSource(int device_index, std::string url, std::string name);
    void grab_loop();

    int device_index_;
    std::string url_;
    std::string name_;

    cv::VideoCapture cap_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    std::mutex mtx_;
    cv::Mat latest_bgra_;
    uint64_t latest_ts_ns_{0};
};

} // namespace motion_clip
