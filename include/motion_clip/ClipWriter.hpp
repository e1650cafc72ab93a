#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}
#include "motion_clip/Chunk.hpp"
#include "motion_clip/Config.hpp"

namespace motion_clip {

/**
 * @brief FFmpeg muxer that encodes BGRA frames into an in-memory clip.
 *
 * Nothing touches the filesystem: every flush of the muxer's I/O buffer is
 * handed to the chunk callback in output order, so concatenating the chunks
 * yields a complete container once close() returns.
 *
 * Usage:
 *   ClipWriter writer;
 *   writer.open(640, 480, cfg, [&](Chunk&& c) { chunks.push_back(std::move(c)); });
 *   writer.write_frame(bgra, pts_ms);
 *   writer.close();
 */
class ClipWriter {
public:
    using ChunkFn = std::function<void(Chunk&&)>;

    ClipWriter() = default;
    ~ClipWriter() { abort(); }

    ClipWriter(const ClipWriter&) = delete;
    ClipWriter& operator=(const ClipWriter&) = delete;

    /// Dimensions are rounded down to even values for 4:2:0 chroma.
    bool open(int width, int height, const RecorderConfig& cfg, ChunkFn on_chunk);

    /// `pts_ms` is the frame's offset from the start of the clip; it is forced
    /// to be strictly increasing.
    bool write_frame(const cv::Mat& bgra, int64_t pts_ms);

    /// Flush the encoder and write the trailer. The final chunks are delivered
    /// before this returns.
    bool close();

    /// Release everything without writing the trailer.
    void abort();

    bool is_open() const { return fmt_ctx_ != nullptr; }
    int64_t frames_written() const { return frames_written_; }
    int width() const { return width_; }
    int height() const { return height_; }

private:
#if LIBAVFORMAT_VERSION_MAJOR >= 61
    static int on_write(void* opaque, const uint8_t* buf, int size);
#else
    static int on_write(void* opaque, uint8_t* buf, int size);
#endif
    bool drain_packets();
    void release();

    std::mutex mtx_;
    ChunkFn on_chunk_;
    AVFormatContext* fmt_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    AVFrame* frame_yuv_ = nullptr;
    AVPacket* pkt_ = nullptr;
    int width_ = 0, height_ = 0;
    int64_t last_pts_ = -1;
    int64_t frames_written_ = 0;
};

} // namespace motion_clip
