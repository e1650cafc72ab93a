#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "motion_clip/ArtifactSink.hpp"
#include "motion_clip/BlockingQueue.hpp"
#include "motion_clip/ClipEncoder.hpp"
#include "motion_clip/Config.hpp"
#include "motion_clip/Errors.hpp"
#include "motion_clip/FrameSource.hpp"
#include "motion_clip/MotionDetector.hpp"
#include "motion_clip/RecordingController.hpp"
#include "motion_clip/Scheduler.hpp"

namespace motion_clip {

/**
 * @brief Detector -> recorder -> encoder -> sink.
 *
 * One MotionDetector per source. A local detection starts a recording of
 * that source; a remote detection is only reported. Sealed sessions go to
 * the encoder and finished artifacts are handed to the sink in the order the
 * sessions were sealed, from a dedicated delivery thread.
 *
 * Register sources and callbacks before start().
 */
class Pipeline {
public:
    using MotionFn = std::function<void(bool is_local)>;
    using FailureFn = std::function<void(const PipelineError&)>;

    Pipeline(Scheduler& scheduler, const PipelineConfig& cfg, std::shared_ptr<ArtifactSink> sink);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// Throws std::logic_error while running.
    void add_source(std::shared_ptr<FrameSource> source, bool is_local);

    void on_motion(MotionFn fn) { on_motion_ = std::move(fn); }
    void on_failure(FailureFn fn) { on_failure_ = std::move(fn); }

    void start();
    /// Stops sampling and drops the live recording and every pending encode;
    /// nothing reaches the sink once this returns.
    void stop();
    bool running() const { return running_; }

    /// Blocks until every submitted encode has been delivered or failed.
    void wait_idle();

    size_t source_count() const { return detectors_.size(); }
    MotionDetector& detector(size_t i) { return *detectors_.at(i); }
    const RecordingController& recorder() const { return recorder_; }

    uint64_t encodes_started() const { return encodes_started_; }
    uint64_t artifacts_delivered() const { return artifacts_delivered_; }
    uint64_t failures() const { return failures_; }

private:
    struct Pending {
        uint64_t session_id = 0;
        uint64_t generation = 0;
        std::future<ClipArtifact> artifact;
    };

    void handle_motion(size_t index, bool is_local);
    void handle_sealed(RecordingSession&& session);
    void deliver_loop(BlockingQueue<Pending>* queue);
    void report(const PipelineError& err);
    void settle();

    Scheduler& scheduler_;
    PipelineConfig cfg_;
    std::shared_ptr<ArtifactSink> sink_;
    MotionFn on_motion_;
    FailureFn on_failure_;

    ClipEncoder encoder_;
    RecordingController recorder_;
    std::vector<std::unique_ptr<MotionDetector>> detectors_;

    // running_ flips and recorder_.start() happen under control_mtx_
    std::mutex control_mtx_;
    std::atomic<bool> running_{false};
    std::unique_ptr<BlockingQueue<Pending>> queue_;
    std::thread delivery_;

    // generation_ and sink calls are serialized so stop() can fence deliveries
    std::mutex deliver_mtx_;
    uint64_t generation_ = 0;

    std::mutex idle_mtx_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;

    std::atomic<uint64_t> encodes_started_{0};
    std::atomic<uint64_t> artifacts_delivered_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace motion_clip
