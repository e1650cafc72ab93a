#include "motion_clip/SyntheticSource.hpp"
#include <chrono>
#include <stdexcept>

using namespace std::chrono;

namespace motion_clip {

SyntheticSource::SyntheticSource(int w, int h, int step)
    : width_(w), height_(h), step_(step)
{
    if (w <= 0 || h <= 0)
        throw std::invalid_argument("SyntheticSource: dimensions must be positive");
}

std::optional<Frame> SyntheticSource::current_frame()
{
    if (!available_) return std::nullopt;

    uint64_t shift = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shift = frame_idx_++ * static_cast<uint64_t>(step_);
    }

    Frame f;
    f.pixels.create(height_, width_, CV_8UC4);
    for (int y = 0; y < height_; ++y) {
        auto* row = f.pixels.ptr<cv::Vec4b>(y);
        for (int x = 0; x < width_; ++x) {
            const uint64_t v = x + y + shift;
            row[x] = cv::Vec4b(static_cast<uint8_t>(v % 256),
                               static_cast<uint8_t>((v / 2) % 256),
                               static_cast<uint8_t>((255 - v) % 256),
                               255);
        }
    }
    f.timestamp_ns = duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
    return f;
}

} // namespace motion_clip
