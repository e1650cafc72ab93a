#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "motion_clip/ClipCapture.hpp"
#include "motion_clip/Config.hpp"
#include "motion_clip/RecordingSession.hpp"
#include "motion_clip/Scheduler.hpp"

namespace motion_clip {

enum class RecordingState { Idle, Recording, Stopped };

/**
 * @brief Idle -> Recording -> Stopped -> Idle.
 *
 * start() opens a session and arms a one-shot timer for the configured
 * duration. When it fires the capture is finalized, the session sealed and
 * handed to the sealed callback, and the controller is Idle again. Only one
 * session can be live per controller.
 */
class RecordingController {
public:
    using SealedFn = std::function<void(RecordingSession&&)>;

    RecordingController(Scheduler& scheduler, const RecorderConfig& cfg, SealedFn on_sealed);
    ~RecordingController() { cancel(); }

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    /// Rejected (returns false, logs AlreadyRecording) unless Idle.
    bool start(std::shared_ptr<FrameSource> source);

    /// Discard the live session, if any. It never reaches the sealed callback.
    void cancel();

    RecordingState state() const;
    uint64_t sessions_sealed() const;

private:
    void finish(uint64_t session_id);
    void seal_and_deliver(uint64_t session_id);
    void append(uint64_t session_id, Chunk&& chunk);

    Scheduler& scheduler_;
    RecorderConfig cfg_;
    SealedFn on_sealed_;
    ClipCapture capture_;

    mutable std::mutex mtx_;
    RecordingState state_ = RecordingState::Idle;
    std::optional<RecordingSession> session_;
    TimerId stop_timer_ = 0;
    uint64_t next_session_id_ = 1;
    uint64_t sealed_count_ = 0;
};

} // namespace motion_clip
