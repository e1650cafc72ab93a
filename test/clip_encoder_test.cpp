#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "motion_clip/ClipEncoder.hpp"
#include "motion_clip/ClipReader.hpp"
#include "motion_clip/ClipWriter.hpp"
#include "motion_clip/Errors.hpp"
#include "motion_clip/GifWriter.hpp"
#include "motion_clip/ManualScheduler.hpp"
#include "motion_clip/PaletteQuantizer.hpp"
#include "motion_clip/RecordingController.hpp"
#include "test_sources.hpp"

using namespace motion_clip;
using namespace motion_clip::test;

namespace {

// Records `duration_ms` of `source` on simulated time and returns the sealed session.
RecordingSession record(std::shared_ptr<FrameSource> source, int duration_ms = 5000)
{
    ManualScheduler sched;
    RecorderConfig cfg;
    cfg.duration_ms = duration_ms;
    std::optional<RecordingSession> out;
    RecordingController rec(sched, cfg, [&](RecordingSession&& s) { out = std::move(s); });
    if (!rec.start(std::move(source))) throw std::runtime_error("recording did not start");
    sched.advance(duration_ms);
    if (!out) throw std::runtime_error("recording was not sealed");
    return std::move(*out);
}

ErrorCode failure_of(std::future<ClipArtifact> f)
{
    try {
        f.get();
    } catch (const PipelineError& e) {
        return e.code();
    }
    ADD_FAILURE() << "encode unexpectedly succeeded";
    return ErrorCode::EncodeFailure;
}

EncoderConfig with_workers(int n)
{
    EncoderConfig cfg;
    cfg.workers = n;
    return cfg;
}

} // namespace

TEST(ClipEncoder, FiveSecondsAtHundredMsIsFiftyFrames)
{
    ClipEncoder enc(EncoderConfig{});
    auto fut = enc.encode(record(ramp_source(160, 120)));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    const ClipArtifact art = fut.get();

    EXPECT_EQ(art.frame_count, 50);
    EXPECT_EQ(art.frame_delay_ms, 100);
    EXPECT_EQ(art.loop_count, 0);
    EXPECT_EQ(art.width, 160);
    EXPECT_EQ(art.height, 120);
    ASSERT_GT(art.bytes.size(), 6u);
    EXPECT_EQ(std::string(art.bytes.begin(), art.bytes.begin() + 6), "GIF89a");
}

TEST(ClipEncoder, GifRoundTripKeepsCountAndOrder)
{
    ClipEncoder enc(EncoderConfig{});
    const ClipArtifact art = enc.encode_now(record(ramp_source(160, 120, 0, 3)));

    const auto frames = ClipReader::decode_all(art.bytes);
    ASSERT_EQ(frames.size(), 50u);
    for (size_t i = 1; i < frames.size(); ++i) {
        EXPECT_GT(frames[i].pts_ms, frames[i - 1].pts_ms);
        EXPECT_GE(mean_luma(frames[i].bgra) + 4.0, mean_luma(frames[i - 1].bgra)) << "frame " << i;
    }
    EXPECT_GT(mean_luma(frames.back().bgra), mean_luma(frames.front().bgra) + 100.0);
    // 100 ms per frame
    EXPECT_NEAR(static_cast<double>(frames[10].pts_ms - frames[0].pts_ms), 1000.0, 20.0);
}

TEST(ClipEncoder, OutputDoesNotDependOnWorkerCount)
{
    const RecordingSession session = record(ramp_source(96, 64, 10, 2));

    ClipEncoder one(with_workers(1));
    ClipEncoder four(with_workers(4));
    ClipEncoder many(with_workers(64));

    const auto a = one.encode_now(session);
    const auto b = four.encode_now(session);
    const auto c = many.encode_now(session);
    EXPECT_EQ(a.frame_count, b.frame_count);
    EXPECT_EQ(a.bytes, b.bytes);
    EXPECT_EQ(a.bytes, c.bytes);
}

TEST(ClipEncoder, ShortClipHoldsLastFrame)
{
    // one second of footage still yields the full 50-slot artifact
    ClipEncoder enc(EncoderConfig{});
    const ClipArtifact art = enc.encode_now(record(ramp_source(64, 48), 1000));
    EXPECT_EQ(art.frame_count, 50);
    EXPECT_EQ(ClipReader::decode_all(art.bytes).size(), 50u);
}

TEST(ClipEncoder, FrameCountFollowsDelay)
{
    EncoderConfig cfg;
    cfg.frame_delay_ms = 200;
    ClipEncoder enc(cfg);
    const ClipArtifact art = enc.encode_now(record(ramp_source(64, 48)));
    EXPECT_EQ(art.frame_count, 25);
    EXPECT_EQ(art.frame_delay_ms, 200);
}

TEST(ClipEncoder, EmptySessionIsDecodeFailure)
{
    ClipEncoder enc(EncoderConfig{});
    RecordingSession s(1, 0, 5000);
    s.seal(0);
    EXPECT_EQ(failure_of(enc.encode(std::move(s))), ErrorCode::DecodeFailure);
}

TEST(ClipEncoder, GarbageSessionIsDecodeFailure)
{
    ClipEncoder enc(EncoderConfig{});
    RecordingSession s(2, 0, 5000);
    Chunk junk(4096);
    for (size_t i = 0; i < junk.size(); ++i) junk[i] = static_cast<uint8_t>((i * 37) ^ 0x5a);
    s.append(std::move(junk));
    s.seal(0);
    EXPECT_EQ(failure_of(enc.encode(std::move(s))), ErrorCode::DecodeFailure);
}

TEST(ClipEncoder, ClipWiderThanGifLimitIsEncodeFailure)
{
    // decodes fine but no GIF logical screen can hold it
    RecorderConfig rcfg;
    rcfg.codec = "ffv1";
    RecordingSession s(4, 0, 5000);
    ClipWriter writer;
    ASSERT_TRUE(writer.open(65538, 2, rcfg, [&](Chunk&& c) { s.append(std::move(c)); }));
    EXPECT_EQ(writer.width(), 65538);
    EXPECT_EQ(writer.height(), 2);
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(writer.write_frame(gray(65538, 2, 60 * i), i * 100));
    ASSERT_TRUE(writer.close());
    EXPECT_EQ(writer.frames_written(), 3);
    s.seal(writer.frames_written());

    ClipEncoder enc(EncoderConfig{});
    EXPECT_EQ(failure_of(enc.encode(std::move(s))), ErrorCode::EncodeFailure);
}

TEST(ClipEncoder, UnsealedSessionIsRejected)
{
    ClipEncoder enc(EncoderConfig{});
    EXPECT_THROW(enc.encode(RecordingSession(3, 0, 5000)), std::invalid_argument);
}

TEST(ClipEncoder, CancelledEncodeFails)
{
    const RecordingSession session = record(ramp_source(320, 240));
    ClipEncoder enc(EncoderConfig{});
    auto fut = enc.encode(RecordingSession(session));
    enc.cancel_all();
    EXPECT_EQ(failure_of(std::move(fut)), ErrorCode::Cancelled);

    // encodes started after the cancel are unaffected
    EXPECT_EQ(enc.encode(RecordingSession(session)).get().frame_count, 50);
}

TEST(ClipEncoder, RejectsInvalidConfig)
{
    EncoderConfig cfg;
    cfg.frame_delay_ms = 0;
    EXPECT_THROW(ClipEncoder{cfg}, std::invalid_argument);
    cfg = EncoderConfig{};
    cfg.workers = 0;
    EXPECT_THROW(ClipEncoder{cfg}, std::invalid_argument);
    cfg = EncoderConfig{};
    cfg.capture_duration_ms = 50;
    EXPECT_THROW(ClipEncoder{cfg}, std::invalid_argument);
}

TEST(PaletteQuantizer, MapsSolidColoursExactly)
{
    PaletteQuantizer q;
    const cv::Mat red = solid(8, 8, 0, 0, 255);
    const cv::Mat blue = solid(8, 8, 255, 0, 0);
    q.accumulate(red);
    q.accumulate(blue);
    q.build();
    EXPECT_EQ(q.colors(), 2);

    const IndexedFrame r = q.map(red);
    const IndexedFrame b = q.map(blue);
    ASSERT_EQ(r.indices.size(), 64u);
    EXPECT_NE(r.indices[0], b.indices[0]);
    EXPECT_EQ(q.palette()[r.indices[0]], 0xFFFF0000u);
    EXPECT_EQ(q.palette()[b.indices[0]], 0xFF0000FFu);
}

TEST(PaletteQuantizer, MergeMatchesSingleAccumulation)
{
    const cv::Mat a = gray(16, 16, 40), b = solid(16, 16, 10, 200, 30), c = gray(16, 16, 250);

    PaletteQuantizer whole;
    whole.accumulate(a);
    whole.accumulate(b);
    whole.accumulate(c);
    whole.build();

    PaletteQuantizer left, right;
    left.accumulate(c);
    right.accumulate(b);
    right.accumulate(a);
    left.merge(right);
    left.build();

    EXPECT_EQ(whole.palette(), left.palette());
    EXPECT_EQ(whole.map(b).indices, left.map(b).indices);
}

TEST(PaletteQuantizer, MapBeforeBuildThrows)
{
    PaletteQuantizer q;
    EXPECT_THROW(q.map(gray(4, 4, 0)), std::logic_error);
}

TEST(GifWriter, RejectsMismatchedFrame)
{
    Palette pal{};
    pal[0] = 0xFF000000u;
    GifWriter gif;
    ASSERT_TRUE(gif.open(4, 4, 10, pal));
    IndexedFrame wrong{3, 4, std::vector<uint8_t>(12, 0)};
    EXPECT_FALSE(gif.write_frame(wrong));
    IndexedFrame right{4, 4, std::vector<uint8_t>(16, 0)};
    EXPECT_TRUE(gif.write_frame(right));
    EXPECT_TRUE(gif.close());
    EXPECT_FALSE(gif.take_bytes().empty());
}
