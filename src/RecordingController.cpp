#include "motion_clip/RecordingController.hpp"
#include "motion_clip/Errors.hpp"
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("RecordingController"); }
}

RecordingController::RecordingController(Scheduler& scheduler, const RecorderConfig& cfg,
                                         SealedFn on_sealed)
    : scheduler_(scheduler), cfg_(cfg), on_sealed_(std::move(on_sealed)), capture_(cfg)
{}

bool RecordingController::start(std::shared_ptr<FrameSource> source)
{
    if (!source) return false;

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != RecordingState::Idle) {
            RCLCPP_ERROR(logger(), "%s: start rejected, session %lu still live",
                         to_string(ErrorCode::AlreadyRecording),
                         static_cast<unsigned long>(session_ ? session_->id() : 0));
            return false;
        }
        id = next_session_id_++;
        session_.emplace(id, scheduler_.now_ms(), cfg_.duration_ms);
        state_ = RecordingState::Recording;
    }

    RCLCPP_INFO(logger(), "Starting recording %lu from %s for %d ms",
                static_cast<unsigned long>(id), source->name().c_str(), cfg_.duration_ms);

    const bool begun = capture_.begin(
        source, scheduler_,
        [this, id](Chunk&& c) { append(id, std::move(c)); },
        [this, id] { seal_and_deliver(id); });
    if (!begun) {
        std::lock_guard<std::mutex> lock(mtx_);
        session_.reset();
        state_ = RecordingState::Idle;
        RCLCPP_ERROR(logger(), "Capture could not begin for %s", source->name().c_str());
        return false;
    }

    const TimerId timer = scheduler_.schedule_once(cfg_.duration_ms, [this, id] { finish(id); });
    std::lock_guard<std::mutex> lock(mtx_);
    if (session_ && session_->id() == id)
        stop_timer_ = timer;
    else
        scheduler_.cancel(timer);
    return true;
}

void RecordingController::append(uint64_t session_id, Chunk&& chunk)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (session_ && session_->id() == session_id) session_->append(std::move(chunk));
}

void RecordingController::finish(uint64_t session_id)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != RecordingState::Recording || !session_ || session_->id() != session_id) return;
        state_ = RecordingState::Stopped;
        stop_timer_ = 0;
    }
    RCLCPP_INFO(logger(), "Stopping recording %lu", static_cast<unsigned long>(session_id));
    capture_.stop();
}

void RecordingController::seal_and_deliver(uint64_t session_id)
{
    std::optional<RecordingSession> sealed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != RecordingState::Stopped || !session_ || session_->id() != session_id) return;
        session_->seal(capture_.frames_captured());
        sealed = std::move(session_);
        session_.reset();
        state_ = RecordingState::Idle;
        ++sealed_count_;
    }

    RCLCPP_INFO(logger(), "Recording %lu sealed: %ld frames, %zu chunks, %zu bytes",
                static_cast<unsigned long>(sealed->id()), static_cast<long>(sealed->frame_count()),
                sealed->chunks().size(), sealed->byte_size());
    if (on_sealed_) on_sealed_(std::move(*sealed));
}

void RecordingController::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ == RecordingState::Idle) return;
        if (stop_timer_) scheduler_.cancel(stop_timer_);
        stop_timer_ = 0;
        RCLCPP_INFO(logger(), "Recording %lu cancelled",
                    static_cast<unsigned long>(session_ ? session_->id() : 0));
        session_.reset();
        state_ = RecordingState::Idle;
    }
    capture_.abort();
}

RecordingState RecordingController::state() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

uint64_t RecordingController::sessions_sealed() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return sealed_count_;
}

} // namespace motion_clip
