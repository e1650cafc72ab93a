#include "motion_clip/Config.hpp"
#include <stdexcept>

namespace motion_clip {

void validate(const DetectorConfig& cfg)
{
    if (cfg.sample_interval_ms <= 0)
        throw std::invalid_argument("sample_interval_ms must be positive");
    if (cfg.diff_threshold == 0)
        throw std::invalid_argument("diff_threshold must be positive");
    if (cfg.width <= 0 || cfg.height <= 0)
        throw std::invalid_argument("detector raster dimensions must be positive");
}

void validate(const RecorderConfig& cfg)
{
    if (cfg.duration_ms <= 0)
        throw std::invalid_argument("recording duration_ms must be positive");
    if (cfg.capture_fps <= 0 || cfg.capture_fps > 1000)
        throw std::invalid_argument("capture_fps must be in (0, 1000]");
    if (cfg.container.empty() || cfg.codec.empty())
        throw std::invalid_argument("container and codec must be named");
    if (cfg.bit_rate <= 0)
        throw std::invalid_argument("bit_rate must be positive");
}

void validate(const EncoderConfig& cfg)
{
    if (cfg.frame_delay_ms < 10)
        throw std::invalid_argument("frame_delay_ms must be at least 10");
    if (cfg.capture_duration_ms < cfg.frame_delay_ms)
        throw std::invalid_argument("capture_duration_ms must cover at least one frame");
    if (cfg.workers <= 0)
        throw std::invalid_argument("workers must be positive");
}

} // namespace motion_clip
