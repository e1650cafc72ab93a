#include "motion_clip/GifWriter.hpp"
#include <cstring>
#include <string>
extern "C" {
#include <libavutil/dict.h>
}
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
constexpr int kIoBufferSize = 32 * 1024;

rclcpp::Logger logger() { return rclcpp::get_logger("GifWriter"); }
}

bool GifWriter::open(int width, int height, int delay_cs, const Palette& palette, int loop)
{
    if (fmt_ctx_) return false;
    if (width <= 0 || height <= 0 || width > 65535 || height > 65535 || delay_cs <= 0) return false;

    width_ = width;
    height_ = height;
    delay_cs_ = delay_cs;
    palette_ = palette;
    frame_index_ = 0;
    bytes_.clear();

    avformat_alloc_output_context2(&fmt_ctx_, nullptr, "gif", nullptr);
    if (!fmt_ctx_) {
        RCLCPP_ERROR(logger(), "gif muxer not available");
        return false;
    }

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_GIF);
    if (!codec) {
        RCLCPP_ERROR(logger(), "gif encoder not available");
        release();
        return false;
    }
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        release();
        return false;
    }
    codec_ctx_->width = width_;
    codec_ctx_->height = height_;
    codec_ctx_->pix_fmt = AV_PIX_FMT_PAL8;
    codec_ctx_->time_base = {1, 100};  // GIF delays are in centiseconds
    codec_ctx_->framerate = {100, delay_cs_};

    if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        RCLCPP_ERROR(logger(), "Could not open gif encoder");
        release();
        return false;
    }

    stream_ = avformat_new_stream(fmt_ctx_, nullptr);
    if (!stream_) {
        release();
        return false;
    }
    stream_->time_base = codec_ctx_->time_base;
    avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);

    auto* io_buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!io_buffer) {
        release();
        return false;
    }
    fmt_ctx_->pb = avio_alloc_context(io_buffer, kIoBufferSize, 1, this, nullptr,
                                      &GifWriter::on_write, nullptr);
    if (!fmt_ctx_->pb) {
        av_free(io_buffer);
        release();
        return false;
    }

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "loop", std::to_string(loop).c_str(), 0);
    const int ret = avformat_write_header(fmt_ctx_, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        RCLCPP_ERROR(logger(), "Failed to write gif header");
        release();
        return false;
    }

    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_ || !pkt_) {
        release();
        return false;
    }
    frame_->format = AV_PIX_FMT_PAL8;
    frame_->width = width_;
    frame_->height = height_;
    if (av_frame_get_buffer(frame_, 0) < 0) {
        release();
        return false;
    }
    return true;
}

bool GifWriter::write_frame(const IndexedFrame& f)
{
    if (!fmt_ctx_) return false;
    if (f.width != width_ || f.height != height_
        || f.indices.size() != static_cast<size_t>(width_) * height_)
        return false;
    if (av_frame_make_writable(frame_) < 0) return false;

    for (int y = 0; y < height_; ++y)
        std::memcpy(frame_->data[0] + static_cast<size_t>(y) * frame_->linesize[0],
                    f.indices.data() + static_cast<size_t>(y) * width_, width_);
    std::memcpy(frame_->data[1], palette_.data(), AVPALETTE_SIZE);

    frame_->pts = frame_index_ * delay_cs_;
    if (avcodec_send_frame(codec_ctx_, frame_) < 0) return false;
    if (!drain_packets()) return false;
    ++frame_index_;
    return true;
}

bool GifWriter::drain_packets()
{
    int ret;
    while ((ret = avcodec_receive_packet(codec_ctx_, pkt_)) == 0) {
        pkt_->duration = delay_cs_;
        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        if (av_interleaved_write_frame(fmt_ctx_, pkt_) < 0) {
            av_packet_unref(pkt_);
            RCLCPP_WARN(logger(), "Failed to mux gif frame");
            return false;
        }
    }
    return ret == AVERROR(EAGAIN) || ret == AVERROR_EOF;
}

bool GifWriter::close()
{
    if (!fmt_ctx_) return false;

    bool ok = avcodec_send_frame(codec_ctx_, nullptr) >= 0;
    ok = drain_packets() && ok;
    ok = av_write_trailer(fmt_ctx_) >= 0 && ok;
    avio_flush(fmt_ctx_->pb);

    release();
    return ok;
}

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int GifWriter::on_write(void* opaque, const uint8_t* buf, int size)
#else
int GifWriter::on_write(void* opaque, uint8_t* buf, int size)
#endif
{
    auto* self = static_cast<GifWriter*>(opaque);
    if (size > 0) self->bytes_.insert(self->bytes_.end(), buf, buf + size);
    return size;
}

void GifWriter::release()
{
    if (fmt_ctx_ && fmt_ctx_->pb) {
        av_freep(&fmt_ctx_->pb->buffer);
        avio_context_free(&fmt_ctx_->pb);
    }
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    avcodec_free_context(&codec_ctx_);
    avformat_free_context(fmt_ctx_);

    fmt_ctx_ = nullptr;
    codec_ctx_ = nullptr;
    stream_ = nullptr;
}

} // namespace motion_clip
