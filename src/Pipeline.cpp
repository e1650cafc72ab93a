#include "motion_clip/Pipeline.hpp"
#include <optional>
#include <stdexcept>
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("Pipeline"); }
}

Pipeline::Pipeline(Scheduler& scheduler, const PipelineConfig& cfg, std::shared_ptr<ArtifactSink> sink)
    : scheduler_(scheduler), cfg_(cfg), sink_(std::move(sink)),
      encoder_(cfg.encoder),
      recorder_(scheduler, cfg.recorder, [this](RecordingSession&& s) { handle_sealed(std::move(s)); })
{
    validate(cfg_.detector);
}

Pipeline::~Pipeline()
{
    stop();
}

void Pipeline::add_source(std::shared_ptr<FrameSource> source, bool is_local)
{
    if (running_) throw std::logic_error("Pipeline: add_source while running");
    const size_t index = detectors_.size();
    detectors_.push_back(std::make_unique<MotionDetector>(
        std::move(source), is_local, cfg_.detector,
        [this, index](bool local) { handle_motion(index, local); }));
}

void Pipeline::start()
{
    if (running_) return;
    if (detectors_.empty()) RCLCPP_WARN(logger(), "Starting with no frame sources");

    BlockingQueue<Pending>* queue;
    {
        std::lock_guard<std::mutex> lk(deliver_mtx_);
        queue_ = std::make_unique<BlockingQueue<Pending>>();
        queue = queue_.get();
    }
    {
        std::lock_guard<std::mutex> lk(control_mtx_);
        running_ = true;
    }
    delivery_ = std::thread(&Pipeline::deliver_loop, this, queue);

    for (auto& d : detectors_) d->start(scheduler_);
    RCLCPP_INFO(logger(), "Pipeline started with %zu source(s)", detectors_.size());
}

void Pipeline::stop()
{
    {
        // waits out a trigger that is already starting a recording
        std::lock_guard<std::mutex> lk(control_mtx_);
        if (!running_.exchange(false)) return;
        recorder_.cancel();
    }

    for (auto& d : detectors_) d->stop();
    encoder_.cancel_all();
    {
        std::lock_guard<std::mutex> lk(deliver_mtx_);
        ++generation_;
        if (queue_) queue_->stop();
    }
    if (delivery_.joinable()) delivery_.join();
    RCLCPP_INFO(logger(), "Pipeline stopped (%lu encodes, %lu artifacts, %lu failures)",
                static_cast<unsigned long>(encodes_started_), static_cast<unsigned long>(artifacts_delivered_),
                static_cast<unsigned long>(failures_));
}

void Pipeline::wait_idle()
{
    std::unique_lock<std::mutex> lk(idle_mtx_);
    idle_cv_.wait(lk, [this] { return in_flight_ == 0; });
}

void Pipeline::handle_motion(size_t index, bool is_local)
{
    if (on_motion_) on_motion_(is_local);
    if (!is_local) {
        RCLCPP_INFO(logger(), "User moved");
        return;
    }
    auto source = detectors_.at(index)->source();
    {
        std::lock_guard<std::mutex> lk(control_mtx_);
        if (!running_) return;
        if (recorder_.start(source)) return;
    }
    report(PipelineError(ErrorCode::AlreadyRecording, "recording of " + source->name() + " rejected"));
}

void Pipeline::handle_sealed(RecordingSession&& session)
{
    if (!running_) {
        RCLCPP_INFO(logger(), "Session %lu sealed after stop, discarded",
                    static_cast<unsigned long>(session.id()));
        return;
    }

    Pending p;
    p.session_id = session.id();
    {
        std::lock_guard<std::mutex> lk(idle_mtx_);
        ++in_flight_;
    }
    p.artifact = encoder_.encode(std::move(session));
    ++encodes_started_;

    std::lock_guard<std::mutex> lk(deliver_mtx_);
    p.generation = generation_;
    if (!queue_ || !queue_->push(std::move(p))) settle();
}

void Pipeline::deliver_loop(BlockingQueue<Pending>* queue)
{
    Pending p;
    while (queue->pop(p)) {
        std::optional<ClipArtifact> artifact;
        try {
            artifact = p.artifact.get();
        } catch (const PipelineError& e) {
            report(e);
        } catch (const std::exception& e) {
            report(PipelineError(ErrorCode::EncodeFailure, e.what()));
        }

        if (artifact) {
            std::lock_guard<std::mutex> lk(deliver_mtx_);
            if (p.generation == generation_ && sink_) {
                sink_->on_artifact_ready(*artifact);
                ++artifacts_delivered_;
            } else {
                RCLCPP_INFO(logger(), "Artifact for session %lu dropped",
                            static_cast<unsigned long>(p.session_id));
            }
        }
        settle();
    }
}

void Pipeline::report(const PipelineError& err)
{
    if (err.code() == ErrorCode::Cancelled) {
        RCLCPP_INFO(logger(), "%s", err.what());
        return;
    }
    ++failures_;
    RCLCPP_ERROR(logger(), "%s", err.what());
    if (on_failure_) on_failure_(err);
}

void Pipeline::settle()
{
    {
        std::lock_guard<std::mutex> lk(idle_mtx_);
        if (in_flight_ > 0) --in_flight_;
    }
    idle_cv_.notify_all();
}

} // namespace motion_clip
