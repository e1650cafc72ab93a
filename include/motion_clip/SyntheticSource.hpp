#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include "motion_clip/FrameSource.hpp"

namespace motion_clip {

/**
 * @brief Fake source that generates a moving gradient in BGRA.
 *
 * Every call to current_frame() advances the pattern by `step` pixels, so two
 * consecutive samples differ everywhere. Useful for running the node without
 * a camera.
 */
class SyntheticSource : public FrameSource {
public:
    SyntheticSource(int width = 640, int height = 480, int step = 8);

    std::optional<Frame> current_frame() override;
    std::string name() const override { return "synthetic"; }

    void set_available(bool available) { available_ = available; }

private:
    int width_, height_, step_;
    std::atomic<bool> available_{true};
    std::mutex mtx_;
    uint64_t frame_idx_{0};
};

} // namespace motion_clip
