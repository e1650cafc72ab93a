#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

namespace motion_clip {

/// 0xAARRGGBB entries, the layout FFmpeg expects in a PAL8 frame.
using Palette = std::array<uint32_t, 256>;

struct IndexedFrame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> indices;  // width * height, row-major
};

/**
 * @brief Popularity quantizer over a 5-bit-per-channel colour histogram.
 *
 * accumulate() every frame of a clip (one quantizer per worker, then
 * merge()), build() once, then map() frames from any thread. Bin sums are
 * integers, so the palette does not depend on how frames were split between
 * workers.
 */
class PaletteQuantizer {
public:
    static constexpr int kBins = 1 << 15;

    PaletteQuantizer();

    void accumulate(const cv::Mat& bgra);
    void merge(const PaletteQuantizer& other);

    /// Pick the palette and fill the bin -> index table.
    void build(int max_colors = 256);

    IndexedFrame map(const cv::Mat& bgra) const;

    const Palette& palette() const { return palette_; }
    int colors() const { return colors_; }
    bool built() const { return built_; }

private:
    static int bin_of(uint8_t b, uint8_t g, uint8_t r) { return ((r >> 3) << 10) | ((g >> 3) << 5) | (b >> 3); }

    std::vector<uint64_t> count_, sum_r_, sum_g_, sum_b_;
    Palette palette_{};
    int colors_ = 0;
    std::vector<uint8_t> lut_;  // bin -> palette index
    bool built_ = false;
};

} // namespace motion_clip
