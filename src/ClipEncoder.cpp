#include "motion_clip/ClipEncoder.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include "motion_clip/ClipReader.hpp"
#include "motion_clip/Errors.hpp"
#include "motion_clip/GifWriter.hpp"
#include "motion_clip/PaletteQuantizer.hpp"
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("ClipEncoder"); }

// Runs fn(worker, i) for every i in [0, n) on `workers` threads. The first
// exception thrown by any worker is rethrown after all of them have joined.
template <typename Fn>
void parallel_for(int workers, size_t n, Fn fn)
{
    workers = std::max(1, std::min<int>(workers, static_cast<int>(n)));
    std::atomic<size_t> next{0};
    std::exception_ptr first_error;
    std::mutex err_mtx;

    auto body = [&](int w) {
        try {
            for (size_t i = next++; i < n; i = next++) fn(w, i);
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lk(err_mtx);
            if (!first_error) first_error = std::current_exception();
            next = n;
        }
    };

    std::vector<std::thread> threads;
    for (int w = 1; w < workers; ++w) threads.emplace_back(body, w);
    body(0);
    for (auto& t : threads) t.join();
    if (first_error) std::rethrow_exception(first_error);
}
}

ClipEncoder::ClipEncoder(const EncoderConfig& cfg) : cfg_(cfg)
{
    validate(cfg_);
}

ClipEncoder::~ClipEncoder()
{
    cancel_all();
    std::list<Job> jobs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        jobs.swap(jobs_);
    }
    for (auto& j : jobs)
        if (j.thread.joinable()) j.thread.join();
}

std::future<ClipArtifact> ClipEncoder::encode(RecordingSession&& session)
{
    if (!session.sealed())
        throw std::invalid_argument("ClipEncoder: session " + std::to_string(session.id()) + " is not sealed");

    reap();

    auto promise = std::make_shared<std::promise<ClipArtifact>>();
    auto future = promise->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);
    const uint64_t epoch = epoch_.load();

    RCLCPP_INFO(logger(), "Encoding session %llu (%zu chunks, %zu bytes)",
                static_cast<unsigned long long>(session.id()), session.chunks().size(), session.byte_size());

    std::thread worker([this, promise, done, epoch, s = std::move(session)]() {
        try {
            promise->set_value(run(s, epoch));
        } catch (const PipelineError& e) {
            RCLCPP_ERROR(logger(), "Session %llu: %s", static_cast<unsigned long long>(s.id()), e.what());
            promise->set_exception(std::current_exception());
        } catch (const std::exception& e) {
            RCLCPP_ERROR(logger(), "Session %llu: encoder error: %s", static_cast<unsigned long long>(s.id()), e.what());
            promise->set_exception(std::make_exception_ptr(PipelineError(ErrorCode::EncodeFailure, e.what())));
        }
        *done = true;
    });

    std::lock_guard<std::mutex> lk(mtx_);
    jobs_.push_back(Job{std::move(worker), std::move(done)});
    return future;
}

ClipArtifact ClipEncoder::encode_now(const RecordingSession& session) const
{
    return run(session, epoch_.load());
}

void ClipEncoder::cancel_all()
{
    ++epoch_;
}

void ClipEncoder::reap()
{
    std::list<Job> finished;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (*it->done) {
                finished.splice(finished.end(), jobs_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& j : finished) j.thread.join();
}

void ClipEncoder::check_cancelled(uint64_t epoch) const
{
    if (epoch_.load() != epoch)
        throw PipelineError(ErrorCode::Cancelled, "encode cancelled");
}

ClipArtifact ClipEncoder::run(const RecordingSession& session, uint64_t epoch) const
{
    const std::vector<uint8_t> clip = session.concatenate();
    if (clip.empty())
        throw PipelineError(ErrorCode::DecodeFailure, "session has no data");

    // Stage 1: decode and sample one raster per delay slot.
    const int slots = cfg_.capture_duration_ms / cfg_.frame_delay_ms;
    std::vector<cv::Mat> drawn;
    drawn.reserve(slots);
    {
        ClipReader reader(clip);
        if (!reader.open())
            throw PipelineError(ErrorCode::DecodeFailure, "clip could not be opened");

        DecodedFrame current, next;
        if (!reader.read(next))
            throw PipelineError(ErrorCode::DecodeFailure, "clip produced zero frames");
        current = std::move(next);
        bool have_next = reader.read(next);

        for (int k = 0; k < slots; ++k) {
            const int64_t t = static_cast<int64_t>(k) * cfg_.frame_delay_ms;
            while (have_next && next.pts_ms <= t) {
                current = std::move(next);
                have_next = reader.read(next);
            }
            drawn.push_back(current.bgra);
        }
        if (reader.failed())
            throw PipelineError(ErrorCode::DecodeFailure, "clip decode error");
    }
    check_cancelled(epoch);

    const int width = drawn.front().cols;
    const int height = drawn.front().rows;
    for (auto& m : drawn) {
        if (m.cols != width || m.rows != height)
            throw PipelineError(ErrorCode::DecodeFailure, "frame size changed mid-clip");
    }

    // Stage 2: one palette for the clip, frames mapped in parallel.
    const int workers = std::max(1, std::min<int>(cfg_.workers, slots));
    std::vector<PaletteQuantizer> partial(workers);
    parallel_for(workers, drawn.size(), [&](int w, size_t i) { partial[w].accumulate(drawn[i]); });
    PaletteQuantizer quantizer;
    for (const auto& p : partial) quantizer.merge(p);
    quantizer.build();
    check_cancelled(epoch);

    std::vector<IndexedFrame> indexed(drawn.size());
    parallel_for(workers, drawn.size(), [&](int, size_t i) { indexed[i] = quantizer.map(drawn[i]); });
    check_cancelled(epoch);

    // Stage 3: GIF.
    GifWriter gif;
    const int delay_cs = cfg_.frame_delay_ms / 10;
    if (!gif.open(width, height, delay_cs, quantizer.palette()))
        throw PipelineError(ErrorCode::EncodeFailure, "gif writer could not be opened");
    for (const auto& f : indexed) {
        if (!gif.write_frame(f))
            throw PipelineError(ErrorCode::EncodeFailure, "gif frame " + std::to_string(gif.frames_written()));
    }
    if (!gif.close())
        throw PipelineError(ErrorCode::EncodeFailure, "gif trailer");

    ClipArtifact art;
    art.bytes = gif.take_bytes();
    if (art.bytes.empty())
        throw PipelineError(ErrorCode::EncodeFailure, "gif writer produced no bytes");
    art.frame_count = static_cast<int>(indexed.size());
    art.frame_delay_ms = delay_cs * 10;
    art.width = width;
    art.height = height;
    art.loop_count = 0;
    art.session_id = session.id();
    check_cancelled(epoch);

    RCLCPP_INFO(logger(), "Session %llu: %d frames %dx%d, %zu bytes, %d colours",
                static_cast<unsigned long long>(session.id()), art.frame_count, width, height,
                art.bytes.size(), quantizer.colors());
    return art;
}

} // namespace motion_clip
