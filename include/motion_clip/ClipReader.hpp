#pragma once
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

namespace motion_clip {

struct DecodedFrame {
    cv::Mat bgra;        // CV_8UC4
    int64_t pts_ms = 0;  // presentation time from clip start
};

/**
 * @brief Decodes a complete in-memory container frame by frame.
 *
 * Works for any container/codec FFmpeg can probe: the intermediate clip as
 * well as the finished GIF. The byte buffer must outlive the reader.
 */
class ClipReader {
public:
    explicit ClipReader(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}
    ~ClipReader() { close(); }

    ClipReader(const ClipReader&) = delete;
    ClipReader& operator=(const ClipReader&) = delete;

    bool open();
    /// Next frame in presentation order; false at end of stream or on error.
    bool read(DecodedFrame& out);
    void close();

    bool failed() const { return failed_; }

    /// Decode everything. Throws PipelineError(DecodeFailure) when the bytes
    /// cannot be opened or yield no frames.
    static std::vector<DecodedFrame> decode_all(const std::vector<uint8_t>& bytes);

private:
    static int on_read(void* opaque, uint8_t* buf, int size);
    static int64_t on_seek(void* opaque, int64_t offset, int whence);
    bool convert(const AVFrame* frame, DecodedFrame& out);

    const std::vector<uint8_t>& bytes_;
    size_t pos_ = 0;

    AVFormatContext* fmt_ctx_ = nullptr;
    AVIOContext* avio_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    int stream_index_ = -1;
    int64_t start_ts_ = AV_NOPTS_VALUE;
    int64_t last_pts_ms_ = -1;
    bool flushing_ = false;
    bool failed_ = false;
};

} // namespace motion_clip
