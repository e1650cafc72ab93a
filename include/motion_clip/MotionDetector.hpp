#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <opencv2/core.hpp>
#include "motion_clip/Config.hpp"
#include "motion_clip/FrameSource.hpp"
#include "motion_clip/Scheduler.hpp"

namespace motion_clip {

enum class DetectionState { Idle, Triggered };

/**
 * @brief Samples a FrameSource on a fixed cadence and raises one motion event
 *        per latch cycle.
 *
 * Each tick resamples the current frame to the configured raster and sums
 * |dB|+|dG|+|dR| against the previous sample. The first sum above the
 * threshold latches the detector and fires the callback; the latch is never
 * cleared automatically.
 */
class MotionDetector {
public:
    using MotionCallback = std::function<void(bool is_local)>;

    MotionDetector(std::shared_ptr<FrameSource> source, bool is_local,
                   const DetectorConfig& cfg, MotionCallback on_motion = {});
    ~MotionDetector() { stop(); }

    MotionDetector(const MotionDetector&) = delete;
    MotionDetector& operator=(const MotionDetector&) = delete;

    /// Arm the recurring sample timer on `scheduler`.
    void start(Scheduler& scheduler);
    void stop();

    /// One sampling cycle. Returns the difference sample, or nullopt when the
    /// source had no frame or there was no previous sample to compare with.
    std::optional<uint64_t> tick();

    /// Clears the latch. The pipeline never calls this.
    void reset_latch();

    DetectionState state() const;
    bool is_local() const { return is_local_; }
    const std::shared_ptr<FrameSource>& source() const { return source_; }

    /// Sum over all pixels of |B1-B2|+|G1-G2|+|R1-R2|; alpha is ignored.
    /// Both rasters must be CV_8UC4 of equal size.
    static uint64_t difference(const cv::Mat& a, const cv::Mat& b);

private:
    cv::Mat resample(const cv::Mat& frame) const;

    std::shared_ptr<FrameSource> source_;
    bool is_local_;
    DetectorConfig cfg_;
    MotionCallback on_motion_;

    Scheduler* scheduler_ = nullptr;
    TimerId timer_ = 0;

    mutable std::mutex mtx_;
    cv::Mat previous_;  // last resampled raster
    DetectionState state_ = DetectionState::Idle;
};

} // namespace motion_clip
