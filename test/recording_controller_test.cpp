#include <gtest/gtest.h>
#include <vector>
#include "motion_clip/ClipReader.hpp"
#include "motion_clip/ManualScheduler.hpp"
#include "motion_clip/RecordingController.hpp"
#include "test_sources.hpp"

using namespace motion_clip;
using namespace motion_clip::test;

namespace {

struct Fixture {
    ManualScheduler sched;
    std::vector<RecordingSession> sealed;
    RecordingController rec{sched, RecorderConfig{}, [this](RecordingSession&& s) { sealed.push_back(std::move(s)); }};
};

} // namespace

TEST(RecordingController, SealsOneSessionAfterDuration)
{
    Fixture f;
    ASSERT_TRUE(f.rec.start(ramp_source(160, 120)));
    EXPECT_EQ(f.rec.state(), RecordingState::Recording);

    f.sched.advance(4999);
    EXPECT_TRUE(f.sealed.empty());
    f.sched.advance(1);

    ASSERT_EQ(f.sealed.size(), 1u);
    const RecordingSession& s = f.sealed.front();
    EXPECT_TRUE(s.sealed());
    EXPECT_EQ(s.start_ms(), 0u);
    EXPECT_EQ(s.duration_ms(), 5000);
    EXPECT_GT(s.frame_count(), 0);
    EXPECT_FALSE(s.chunks().empty());
    EXPECT_GT(s.byte_size(), 0u);
    EXPECT_EQ(f.rec.state(), RecordingState::Idle);
    EXPECT_EQ(f.rec.sessions_sealed(), 1u);
    EXPECT_TRUE(f.sched.idle());
}

TEST(RecordingController, SecondStartIsRejected)
{
    Fixture f;
    auto first = ramp_source(160, 120);
    auto second = std::make_shared<ScriptedSource>(
        [](int) -> std::optional<cv::Mat> { return gray(320, 240, 200); }, "second");

    ASSERT_TRUE(f.rec.start(first));
    f.sched.advance(1000);
    EXPECT_FALSE(f.rec.start(second));
    EXPECT_EQ(second->calls(), 0);
    EXPECT_EQ(f.rec.state(), RecordingState::Recording);

    f.sched.advance(4000);
    ASSERT_EQ(f.sealed.size(), 1u);

    // the rejected start left the first session intact: its clip still
    // decodes in capture order at the first source's size
    const auto bytes = f.sealed.front().concatenate();
    const auto frames = ClipReader::decode_all(bytes);
    EXPECT_EQ(static_cast<int64_t>(frames.size()), f.sealed.front().frame_count());
    EXPECT_EQ(frames.front().bgra.cols, 160);
    EXPECT_EQ(frames.front().bgra.rows, 120);
}

TEST(RecordingController, ChunksKeepCaptureOrder)
{
    Fixture f;
    ASSERT_TRUE(f.rec.start(ramp_source(160, 120, 0, 3)));
    f.sched.advance(5000);
    ASSERT_EQ(f.sealed.size(), 1u);

    const auto frames = ClipReader::decode_all(f.sealed.front().concatenate());
    ASSERT_GT(frames.size(), 10u);
    for (size_t i = 1; i < frames.size(); ++i) {
        EXPECT_GE(frames[i].pts_ms, frames[i - 1].pts_ms);
        EXPECT_GE(mean_luma(frames[i].bgra) + 4.0, mean_luma(frames[i - 1].bgra)) << "frame " << i;
    }
    EXPECT_GT(mean_luma(frames.back().bgra), mean_luma(frames.front().bgra) + 100.0);
}

TEST(RecordingController, CanRecordAgainAfterSeal)
{
    Fixture f;
    ASSERT_TRUE(f.rec.start(ramp_source(160, 120)));
    f.sched.advance(5000);
    ASSERT_TRUE(f.rec.start(ramp_source(160, 120)));
    f.sched.advance(5000);
    ASSERT_EQ(f.sealed.size(), 2u);
    EXPECT_NE(f.sealed[0].id(), f.sealed[1].id());
    EXPECT_EQ(f.sealed[1].start_ms(), 5000u);
}

TEST(RecordingController, CancelledSessionIsNeverDelivered)
{
    Fixture f;
    ASSERT_TRUE(f.rec.start(ramp_source(160, 120)));
    f.sched.advance(2000);
    f.rec.cancel();
    EXPECT_EQ(f.rec.state(), RecordingState::Idle);

    f.sched.advance(10000);
    EXPECT_TRUE(f.sealed.empty());
    EXPECT_EQ(f.rec.sessions_sealed(), 0u);
    EXPECT_TRUE(f.sched.idle());

    ASSERT_TRUE(f.rec.start(ramp_source(160, 120)));
    f.sched.advance(5000);
    EXPECT_EQ(f.sealed.size(), 1u);
}

TEST(RecordingController, UnavailableSourceSealsEmptySession)
{
    Fixture f;
    auto src = std::make_shared<ScriptedSource>([](int) -> std::optional<cv::Mat> { return std::nullopt; });
    ASSERT_TRUE(f.rec.start(src));
    f.sched.advance(5000);
    ASSERT_EQ(f.sealed.size(), 1u);
    EXPECT_EQ(f.sealed.front().frame_count(), 0);
    EXPECT_EQ(f.sealed.front().byte_size(), 0u);
}

TEST(RecordingSession, RejectsAppendAfterSeal)
{
    RecordingSession s(7, 100, 5000);
    EXPECT_TRUE(s.append(Chunk{1, 2, 3}));
    EXPECT_TRUE(s.append(Chunk{4}));
    s.seal(1);
    EXPECT_FALSE(s.append(Chunk{5}));
    EXPECT_EQ(s.concatenate(), (std::vector<uint8_t>{1, 2, 3, 4}));
    EXPECT_EQ(s.byte_size(), 4u);
}
