#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include "motion_clip/ClipWriter.hpp"
#include "motion_clip/Config.hpp"
#include "motion_clip/FrameSource.hpp"
#include "motion_clip/Scheduler.hpp"

namespace motion_clip {

/**
 * @brief Pulls frames from a source at the capture rate and streams the
 *        encoded clip out as ordered chunks.
 *
 * begin() grabs the first frame immediately and then every 1000/fps ms on the
 * scheduler. stop() must be called exactly once per begin(); it finalizes the
 * container and then raises the stopped signal.
 */
class ClipCapture {
public:
    using ChunkFn = ClipWriter::ChunkFn;
    using StoppedFn = std::function<void()>;

    explicit ClipCapture(const RecorderConfig& cfg);
    ~ClipCapture() { abort(); }

    ClipCapture(const ClipCapture&) = delete;
    ClipCapture& operator=(const ClipCapture&) = delete;

    bool begin(std::shared_ptr<FrameSource> source, Scheduler& scheduler,
               ChunkFn on_chunk, StoppedFn on_stopped);
    void stop();
    /// Drop the capture without finalizing or signalling.
    void abort();

    int64_t frames_captured() const;

private:
    void grab();

    RecorderConfig cfg_;
    mutable std::mutex mtx_;
    ClipWriter writer_;

    std::shared_ptr<FrameSource> source_;
    Scheduler* scheduler_ = nullptr;
    TimerId timer_ = 0;
    ChunkFn on_chunk_;
    StoppedFn on_stopped_;
    uint64_t start_ms_ = 0;
    bool running_ = false;
    bool failed_ = false;
    int64_t frames_ = 0;
};

} // namespace motion_clip
