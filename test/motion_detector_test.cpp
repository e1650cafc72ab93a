#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "motion_clip/ManualScheduler.hpp"
#include "motion_clip/MotionDetector.hpp"
#include "test_sources.hpp"

using namespace motion_clip;
using namespace motion_clip::test;

namespace {

constexpr int W = 649;
constexpr int H = 480;
constexpr uint64_t kRedDiff = 79'423'200ULL;  // 649 * 480 * 255

std::shared_ptr<ScriptedSource> black_then_red(int w = W, int h = H)
{
    return std::make_shared<ScriptedSource>([=](int n) -> std::optional<cv::Mat> {
        return n == 0 ? solid(w, h, 0, 0, 0) : solid(w, h, 0, 0, 255);
    });
}

} // namespace

TEST(MotionDetector, IdenticalFramesDifferByZero)
{
    auto src = std::make_shared<ScriptedSource>(
        [](int) -> std::optional<cv::Mat> { return solid(W, H, 0, 0, 0); });
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });

    EXPECT_FALSE(det.tick().has_value());  // first sample only
    auto diff = det.tick();
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(*diff, 0u);
    EXPECT_EQ(events, 0);
    EXPECT_EQ(det.state(), DetectionState::Idle);
}

TEST(MotionDetector, SaturatedRedFiresExactlyOnce)
{
    std::vector<bool> events;
    MotionDetector det(black_then_red(), true, DetectorConfig{}, [&](bool local) { events.push_back(local); });

    det.tick();
    auto diff = det.tick();
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(*diff, kRedDiff);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0]);
    EXPECT_EQ(det.state(), DetectionState::Triggered);
}

TEST(MotionDetector, AlphaChannelIsIgnored)
{
    cv::Mat a(H, W, CV_8UC4, cv::Scalar(10, 20, 30, 0));
    cv::Mat b(H, W, CV_8UC4, cv::Scalar(10, 20, 30, 255));
    EXPECT_EQ(MotionDetector::difference(a, b), 0u);

    cv::Mat c(H, W, CV_8UC4, cv::Scalar(11, 18, 30, 7));
    EXPECT_EQ(MotionDetector::difference(a, c), static_cast<uint64_t>(W) * H * 3);
}

TEST(MotionDetector, LatchSuppressesLaterEvents)
{
    // black, red, black, red, ... every pair is far above threshold
    auto src = std::make_shared<ScriptedSource>([](int n) -> std::optional<cv::Mat> {
        return n % 2 == 0 ? solid(W, H, 0, 0, 0) : solid(W, H, 0, 0, 255);
    });
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });

    for (int i = 0; i < 10; ++i) det.tick();
    EXPECT_EQ(events, 1);
    EXPECT_EQ(det.state(), DetectionState::Triggered);
}

TEST(MotionDetector, ExplicitResetRearmsLatch)
{
    auto src = std::make_shared<ScriptedSource>([](int n) -> std::optional<cv::Mat> {
        return n % 2 == 0 ? solid(W, H, 0, 0, 0) : solid(W, H, 0, 0, 255);
    });
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });

    det.tick();
    det.tick();
    ASSERT_EQ(events, 1);
    det.reset_latch();
    EXPECT_EQ(det.state(), DetectionState::Idle);
    det.tick();
    EXPECT_EQ(events, 2);
}

TEST(MotionDetector, BelowThresholdDoesNotFire)
{
    // 649*480*3*8 = 7,476,480 < 7,718,920
    auto src = std::make_shared<ScriptedSource>([](int n) -> std::optional<cv::Mat> {
        return gray(W, H, n == 0 ? 0 : 8);
    });
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });
    det.tick();
    EXPECT_EQ(*det.tick(), 7'476'480u);
    EXPECT_EQ(events, 0);
}

TEST(MotionDetector, UnavailableSourceIsSkipped)
{
    // unavailable, unavailable, black, red
    auto src = std::make_shared<ScriptedSource>([](int n) -> std::optional<cv::Mat> {
        if (n < 2) return std::nullopt;
        return n == 2 ? solid(W, H, 0, 0, 0) : solid(W, H, 0, 0, 255);
    });
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });

    EXPECT_FALSE(det.tick().has_value());
    EXPECT_FALSE(det.tick().has_value());
    EXPECT_FALSE(det.tick().has_value());  // first real sample
    EXPECT_EQ(*det.tick(), kRedDiff);
    EXPECT_EQ(events, 1);
}

TEST(MotionDetector, LargerSourceIsResampled)
{
    int events = 0;
    MotionDetector det(black_then_red(2 * W, 2 * H), true, DetectorConfig{}, [&](bool) { ++events; });
    det.tick();
    EXPECT_EQ(*det.tick(), kRedDiff);
    EXPECT_EQ(events, 1);
}

TEST(MotionDetector, RemoteDetectorReportsRemote)
{
    std::vector<bool> events;
    MotionDetector det(black_then_red(), false, DetectorConfig{}, [&](bool local) { events.push_back(local); });
    det.tick();
    det.tick();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0]);
}

TEST(MotionDetector, InstancesDoNotShareLatch)
{
    int a_events = 0, b_events = 0;
    MotionDetector a(black_then_red(), true, DetectorConfig{}, [&](bool) { ++a_events; });
    MotionDetector b(black_then_red(), false, DetectorConfig{}, [&](bool) { ++b_events; });

    a.tick();
    a.tick();
    EXPECT_EQ(a.state(), DetectionState::Triggered);
    EXPECT_EQ(b.state(), DetectionState::Idle);

    b.tick();
    b.tick();
    EXPECT_EQ(a_events, 1);
    EXPECT_EQ(b_events, 1);
}

TEST(MotionDetector, SamplesOnSchedulerCadence)
{
    ManualScheduler sched;
    auto src = black_then_red();
    int events = 0;
    MotionDetector det(src, true, DetectorConfig{}, [&](bool) { ++events; });
    det.start(sched);

    sched.advance(1999);
    EXPECT_EQ(src->calls(), 0);
    sched.advance(1);
    EXPECT_EQ(src->calls(), 1);
    sched.advance(2000);
    EXPECT_EQ(src->calls(), 2);
    EXPECT_EQ(events, 1);

    sched.advance(20000);
    EXPECT_EQ(src->calls(), 12);
    EXPECT_EQ(events, 1);

    det.stop();
    sched.advance(10000);
    EXPECT_EQ(src->calls(), 12);
}

TEST(MotionDetector, RejectsInvalidConfig)
{
    auto src = black_then_red();
    DetectorConfig bad;
    bad.diff_threshold = 0;
    EXPECT_THROW(MotionDetector(src, true, bad), std::invalid_argument);

    bad = DetectorConfig{};
    bad.width = 0;
    EXPECT_THROW(MotionDetector(src, true, bad), std::invalid_argument);

    EXPECT_THROW(MotionDetector(nullptr, true, DetectorConfig{}), std::invalid_argument);
}
