#pragma once
#include <cstdint>
#include <utility>
#include <vector>
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}
#include "motion_clip/PaletteQuantizer.hpp"

namespace motion_clip {

/**
 * @brief FFmpeg gif encoder + muxer writing an animated GIF into memory.
 *
 * Usage:
 *   GifWriter gif;
 *   gif.open(w, h, 10, palette);   // 10 cs = 100 ms per frame, loops forever
 *   gif.write_frame(indexed);
 *   gif.close();
 *   auto bytes = gif.take_bytes();
 */
class GifWriter {
public:
    GifWriter() = default;
    ~GifWriter() { release(); }

    GifWriter(const GifWriter&) = delete;
    GifWriter& operator=(const GifWriter&) = delete;

    /// `loop` follows the GIF extension: 0 repeats forever.
    bool open(int width, int height, int delay_cs, const Palette& palette, int loop = 0);
    bool write_frame(const IndexedFrame& frame);
    bool close();

    std::vector<uint8_t> take_bytes() { return std::move(bytes_); }
    int64_t frames_written() const { return frame_index_; }

private:
#if LIBAVFORMAT_VERSION_MAJOR >= 61
    static int on_write(void* opaque, const uint8_t* buf, int size);
#else
    static int on_write(void* opaque, uint8_t* buf, int size);
#endif
    bool drain_packets();
    void release();

    AVFormatContext* fmt_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    Palette palette_{};
    int width_ = 0, height_ = 0, delay_cs_ = 0;
    int64_t frame_index_ = 0;
    std::vector<uint8_t> bytes_;
};

} // namespace motion_clip
