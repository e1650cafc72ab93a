#include "motion_clip/ClipWriter.hpp"
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
constexpr int kIoBufferSize = 64 * 1024;

rclcpp::Logger logger() { return rclcpp::get_logger("ClipWriter"); }
}

bool ClipWriter::open(int width, int height, const RecorderConfig& cfg, ChunkFn on_chunk)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (fmt_ctx_) return false;

    width_ = width & ~1;
    height_ = height & ~1;
    if (width_ < 2 || height_ < 2) {
        RCLCPP_ERROR(logger(), "Frame too small for a clip: %dx%d", width, height);
        return false;
    }
    on_chunk_ = std::move(on_chunk);
    last_pts_ = -1;
    frames_written_ = 0;

    avformat_alloc_output_context2(&fmt_ctx_, nullptr, cfg.container.c_str(), nullptr);
    if (!fmt_ctx_) {
        RCLCPP_ERROR(logger(), "Could not allocate %s output context", cfg.container.c_str());
        return false;
    }

    const AVCodec* codec = avcodec_find_encoder_by_name(cfg.codec.c_str());
    if (!codec) {
        RCLCPP_ERROR(logger(), "Codec not found: %s", cfg.codec.c_str());
        release();
        return false;
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        release();
        return false;
    }
    codec_ctx_->codec_id = codec->id;
    codec_ctx_->width = width_;
    codec_ctx_->height = height_;
    codec_ctx_->time_base = {1, 1000};  // pts in milliseconds
    codec_ctx_->framerate = {cfg.capture_fps, 1};
    codec_ctx_->gop_size = cfg.capture_fps;
    codec_ctx_->max_b_frames = 0;
    codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codec_ctx_->bit_rate = cfg.bit_rate;

    if (fmt_ctx_->oformat->flags & AVFMT_GLOBALHEADER)
        codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        RCLCPP_ERROR(logger(), "Could not open codec %s", cfg.codec.c_str());
        release();
        return false;
    }

    stream_ = avformat_new_stream(fmt_ctx_, nullptr);
    if (!stream_) {
        release();
        return false;
    }
    stream_->id = fmt_ctx_->nb_streams - 1;
    stream_->time_base = codec_ctx_->time_base;
    avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);

    auto* io_buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!io_buffer) {
        release();
        return false;
    }
    fmt_ctx_->pb = avio_alloc_context(io_buffer, kIoBufferSize, 1, this, nullptr,
                                      &ClipWriter::on_write, nullptr);
    if (!fmt_ctx_->pb) {
        av_free(io_buffer);
        release();
        return false;
    }
    // one chunk per muxed packet
    fmt_ctx_->flush_packets = 1;

    if (avformat_write_header(fmt_ctx_, nullptr) < 0) {
        RCLCPP_ERROR(logger(), "Failed to write %s header", cfg.container.c_str());
        release();
        return false;
    }

    frame_yuv_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_yuv_ || !pkt_) {
        release();
        return false;
    }
    frame_yuv_->format = AV_PIX_FMT_YUV420P;
    frame_yuv_->width = width_;
    frame_yuv_->height = height_;
    if (av_frame_get_buffer(frame_yuv_, 0) < 0) {
        release();
        return false;
    }
    return true;
}

bool ClipWriter::write_frame(const cv::Mat& bgra, int64_t pts_ms)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!fmt_ctx_ || !codec_ctx_) return false;
    if (bgra.empty() || bgra.type() != CV_8UC4) return false;

    // Scale from whatever the source delivers now to the clip's fixed size.
    sws_ctx_ = sws_getCachedContext(sws_ctx_, bgra.cols, bgra.rows, AV_PIX_FMT_BGRA,
                                    width_, height_, AV_PIX_FMT_YUV420P,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) return false;
    if (av_frame_make_writable(frame_yuv_) < 0) return false;

    const uint8_t* src_slices[1] = { bgra.data };
    int src_stride[1] = { static_cast<int>(bgra.step) };
    sws_scale(sws_ctx_, src_slices, src_stride, 0, bgra.rows,
              frame_yuv_->data, frame_yuv_->linesize);

    if (pts_ms <= last_pts_) pts_ms = last_pts_ + 1;
    frame_yuv_->pts = pts_ms;
    last_pts_ = pts_ms;

    if (avcodec_send_frame(codec_ctx_, frame_yuv_) < 0) return false;
    if (!drain_packets()) return false;
    ++frames_written_;
    return true;
}

bool ClipWriter::drain_packets()
{
    int ret;
    while ((ret = avcodec_receive_packet(codec_ctx_, pkt_)) == 0) {
        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        if (av_interleaved_write_frame(fmt_ctx_, pkt_) < 0) {
            av_packet_unref(pkt_);
            RCLCPP_WARN(logger(), "Failed to mux packet");
            return false;
        }
    }
    return ret == AVERROR(EAGAIN) || ret == AVERROR_EOF;
}

bool ClipWriter::close()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!fmt_ctx_) return false;

    bool ok = avcodec_send_frame(codec_ctx_, nullptr) >= 0;
    ok = drain_packets() && ok;
    ok = av_write_trailer(fmt_ctx_) >= 0 && ok;
    avio_flush(fmt_ctx_->pb);

    release();
    return ok;
}

void ClipWriter::abort()
{
    std::lock_guard<std::mutex> lock(mtx_);
    on_chunk_ = nullptr;
    release();
}

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int ClipWriter::on_write(void* opaque, const uint8_t* buf, int size)
#else
int ClipWriter::on_write(void* opaque, uint8_t* buf, int size)
#endif
{
    auto* self = static_cast<ClipWriter*>(opaque);
    if (size > 0 && self->on_chunk_) self->on_chunk_(Chunk(buf, buf + size));
    return size;
}

void ClipWriter::release()
{
    if (fmt_ctx_ && fmt_ctx_->pb) {
        av_freep(&fmt_ctx_->pb->buffer);
        avio_context_free(&fmt_ctx_->pb);
    }
    av_frame_free(&frame_yuv_);
    av_packet_free(&pkt_);
    sws_freeContext(sws_ctx_);
    avcodec_free_context(&codec_ctx_);
    avformat_free_context(fmt_ctx_);

    fmt_ctx_ = nullptr;
    codec_ctx_ = nullptr;
    stream_ = nullptr;
    sws_ctx_ = nullptr;
    frame_yuv_ = nullptr;
    pkt_ = nullptr;
}

} // namespace motion_clip
