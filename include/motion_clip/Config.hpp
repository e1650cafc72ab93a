#pragma once
#include <cstdint>
#include <string>

namespace motion_clip {

/* Frame differencing parameters. */
struct DetectorConfig {
    int sample_interval_ms{2000};      // tick cadence
    uint64_t diff_threshold{7718920};  // event fires when sum > threshold
    int width{649};                    // comparison raster
    int height{480};
};

/* Fixed-duration recording of the intermediate clip. */
struct RecorderConfig {
    int duration_ms{5000};
    int capture_fps{15};
    std::string container{"matroska"};
    std::string codec{"mpeg4"};
    int64_t bit_rate{4'000'000};
};

/* Animated image encoding. */
struct EncoderConfig {
    int frame_delay_ms{100};
    int capture_duration_ms{5000};  // playback span sampled into the artifact
    int workers{2};                 // quantizer threads
};

struct PipelineConfig {
    DetectorConfig detector;
    RecorderConfig recorder;
    EncoderConfig encoder;
};

void validate(const DetectorConfig& cfg);
void validate(const RecorderConfig& cfg);
void validate(const EncoderConfig& cfg);

} // namespace motion_clip
