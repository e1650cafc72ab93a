#include <gtest/gtest.h>
#include <stdexcept>
#include "motion_clip/MotionDetector.hpp"
#include "motion_clip/SyntheticSource.hpp"
#include "motion_clip/VideoCaptureSource.hpp"

using namespace motion_clip;

TEST(SyntheticSource, ProducesBgraFramesThatMove)
{
    SyntheticSource src(64, 48, 8);
    auto a = src.current_frame();
    auto b = src.current_frame();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->pixels.type(), CV_8UC4);
    EXPECT_EQ(a->width(), 64);
    EXPECT_EQ(a->height(), 48);
    EXPECT_GT(MotionDetector::difference(a->pixels, b->pixels), 0u);
}

TEST(SyntheticSource, CanBeMadeUnavailable)
{
    SyntheticSource src(16, 16);
    src.set_available(false);
    EXPECT_FALSE(src.current_frame().has_value());
    src.set_available(true);
    EXPECT_TRUE(src.current_frame().has_value());
}

TEST(SyntheticSource, RejectsEmptyRaster)
{
    EXPECT_THROW(SyntheticSource(0, 10), std::invalid_argument);
}

TEST(VideoCaptureSource, UnopenedSourceHasNoFrame)
{
    auto cam = VideoCaptureSource::camera(3);
    EXPECT_EQ(cam.name(), "camera:3");
    EXPECT_FALSE(cam.is_open());
    EXPECT_FALSE(cam.current_frame().has_value());
}

TEST(VideoCaptureSource, MissingStreamThrowsOnOpen)
{
    auto src = VideoCaptureSource::stream("/nonexistent/motion_clip/none.mkv");
    EXPECT_THROW(src.open(), std::runtime_error);
    EXPECT_FALSE(src.is_open());
}
