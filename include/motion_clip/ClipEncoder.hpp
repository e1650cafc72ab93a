#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "motion_clip/Config.hpp"
#include "motion_clip/RecordingSession.hpp"

namespace motion_clip {

struct ClipArtifact {
    std::vector<uint8_t> bytes;  // GIF89a
    int frame_count = 0;
    int frame_delay_ms = 0;
    int width = 0;
    int height = 0;
    int loop_count = 0;  // 0 = forever
    uint64_t session_id = 0;
};

/**
 * @brief Sealed session -> looping animated GIF.
 *
 * The session is decoded back into frames, sampled every frame_delay_ms over
 * capture_duration_ms, quantized to one palette for the whole clip and
 * written by FFmpeg's gif encoder. encode() returns immediately; the future
 * carries the artifact or a PipelineError (DecodeFailure, EncodeFailure,
 * Cancelled).
 */
class ClipEncoder {
public:
    explicit ClipEncoder(const EncoderConfig& cfg);
    ~ClipEncoder();

    ClipEncoder(const ClipEncoder&) = delete;
    ClipEncoder& operator=(const ClipEncoder&) = delete;

    /// Throws std::invalid_argument if the session is not sealed.
    std::future<ClipArtifact> encode(RecordingSession&& session);

    /// Synchronous variant used by the background jobs.
    ClipArtifact encode_now(const RecordingSession& session) const;

    /// Every encode started before this call fails with Cancelled.
    void cancel_all();

private:
    ClipArtifact run(const RecordingSession& session, uint64_t epoch) const;
    void check_cancelled(uint64_t epoch) const;
    void reap();

    struct Job {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    EncoderConfig cfg_;
    std::atomic<uint64_t> epoch_{0};
    std::mutex mtx_;
    std::list<Job> jobs_;
};

} // namespace motion_clip
