#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

namespace motion_clip {

/**
 * @brief Immutable raster snapshot taken from a FrameSource.
 *
 * Pixels are CV_8UC4 in BGRA order, row-major and contiguous. Whoever holds
 * the Frame owns it; nothing writes into `pixels` after capture.
 */
struct Frame {
  cv::Mat pixels;
  uint64_t timestamp_ns{0};

  int width() const { return pixels.cols; }
  int height() const { return pixels.rows; }
  bool empty() const { return pixels.empty(); }
};

} // namespace motion_clip
