#include "motion_clip/PaletteQuantizer.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace motion_clip {

PaletteQuantizer::PaletteQuantizer()
    : count_(kBins, 0), sum_r_(kBins, 0), sum_g_(kBins, 0), sum_b_(kBins, 0)
{}

void PaletteQuantizer::accumulate(const cv::Mat& bgra)
{
    CV_Assert(bgra.type() == CV_8UC4);
    for (int y = 0; y < bgra.rows; ++y) {
        const auto* row = bgra.ptr<cv::Vec4b>(y);
        for (int x = 0; x < bgra.cols; ++x) {
            const cv::Vec4b& p = row[x];
            const int bin = bin_of(p[0], p[1], p[2]);
            ++count_[bin];
            sum_b_[bin] += p[0];
            sum_g_[bin] += p[1];
            sum_r_[bin] += p[2];
        }
    }
}

void PaletteQuantizer::merge(const PaletteQuantizer& other)
{
    for (int i = 0; i < kBins; ++i) {
        count_[i] += other.count_[i];
        sum_r_[i] += other.sum_r_[i];
        sum_g_[i] += other.sum_g_[i];
        sum_b_[i] += other.sum_b_[i];
    }
}

void PaletteQuantizer::build(int max_colors)
{
    if (max_colors < 2 || max_colors > 256)
        throw std::invalid_argument("PaletteQuantizer: max_colors must be in [2, 256]");

    std::vector<int> occupied;
    for (int i = 0; i < kBins; ++i)
        if (count_[i] > 0) occupied.push_back(i);

    // most populous first, lower bin wins ties
    std::sort(occupied.begin(), occupied.end(), [&](int a, int b) {
        return count_[a] != count_[b] ? count_[a] > count_[b] : a < b;
    });

    palette_.fill(0xFF000000u);
    colors_ = static_cast<int>(std::min<size_t>(occupied.size(), max_colors));
    if (colors_ == 0) colors_ = 1;  // empty histogram: a single black entry

    std::array<int, 256> pr{}, pg{}, pb{};
    for (int i = 0; i < static_cast<int>(std::min<size_t>(occupied.size(), max_colors)); ++i) {
        const int bin = occupied[i];
        const uint64_t n = count_[bin];
        pr[i] = static_cast<int>((sum_r_[bin] + n / 2) / n);
        pg[i] = static_cast<int>((sum_g_[bin] + n / 2) / n);
        pb[i] = static_cast<int>((sum_b_[bin] + n / 2) / n);
        palette_[i] = 0xFF000000u | (uint32_t(pr[i]) << 16) | (uint32_t(pg[i]) << 8) | uint32_t(pb[i]);
    }

    lut_.assign(kBins, 0);
    for (int bin = 0; bin < kBins; ++bin) {
        int r, g, b;
        if (count_[bin] > 0) {
            const uint64_t n = count_[bin];
            r = static_cast<int>((sum_r_[bin] + n / 2) / n);
            g = static_cast<int>((sum_g_[bin] + n / 2) / n);
            b = static_cast<int>((sum_b_[bin] + n / 2) / n);
        } else {
            r = ((bin >> 10) & 31) * 8 + 4;
            g = ((bin >> 5) & 31) * 8 + 4;
            b = (bin & 31) * 8 + 4;
        }
        int best = 0;
        int best_d = std::numeric_limits<int>::max();
        for (int i = 0; i < colors_; ++i) {
            const int dr = r - pr[i], dg = g - pg[i], db = b - pb[i];
            const int d = dr * dr + dg * dg + db * db;
            if (d < best_d) {
                best_d = d;
                best = i;
                if (d == 0) break;
            }
        }
        lut_[bin] = static_cast<uint8_t>(best);
    }
    built_ = true;
}

IndexedFrame PaletteQuantizer::map(const cv::Mat& bgra) const
{
    if (!built_) throw std::logic_error("PaletteQuantizer::map before build");
    CV_Assert(bgra.type() == CV_8UC4);

    IndexedFrame out;
    out.width = bgra.cols;
    out.height = bgra.rows;
    out.indices.resize(static_cast<size_t>(bgra.cols) * bgra.rows);

    uint8_t* dst = out.indices.data();
    for (int y = 0; y < bgra.rows; ++y) {
        const auto* row = bgra.ptr<cv::Vec4b>(y);
        for (int x = 0; x < bgra.cols; ++x) {
            const cv::Vec4b& p = row[x];
            *dst++ = lut_[bin_of(p[0], p[1], p[2])];
        }
    }
    return out;
}

} // namespace motion_clip
