#include "motion_clip/ClipReader.hpp"
#include <algorithm>
#include <cstring>
#include "motion_clip/Errors.hpp"
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace {
constexpr int kIoBufferSize = 32 * 1024;

rclcpp::Logger logger() { return rclcpp::get_logger("ClipReader"); }
}

int ClipReader::on_read(void* opaque, uint8_t* buf, int size)
{
    auto* self = static_cast<ClipReader*>(opaque);
    const size_t left = self->bytes_.size() - self->pos_;
    if (left == 0) return AVERROR_EOF;
    const size_t n = std::min(left, static_cast<size_t>(size));
    std::memcpy(buf, self->bytes_.data() + self->pos_, n);
    self->pos_ += n;
    return static_cast<int>(n);
}

int64_t ClipReader::on_seek(void* opaque, int64_t offset, int whence)
{
    auto* self = static_cast<ClipReader*>(opaque);
    const auto size = static_cast<int64_t>(self->bytes_.size());
    whence &= ~AVSEEK_FORCE;
    if (whence == AVSEEK_SIZE) return size;

    int64_t pos;
    switch (whence) {
    case SEEK_SET: pos = offset; break;
    case SEEK_CUR: pos = static_cast<int64_t>(self->pos_) + offset; break;
    case SEEK_END: pos = size + offset; break;
    default: return AVERROR(EINVAL);
    }
    if (pos < 0 || pos > size) return AVERROR(EINVAL);
    self->pos_ = static_cast<size_t>(pos);
    return pos;
}

bool ClipReader::open()
{
    if (fmt_ctx_) return true;
    if (bytes_.empty()) {
        failed_ = true;
        return false;
    }
    pos_ = 0;

    auto* io_buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!io_buffer) {
        failed_ = true;
        return false;
    }
    avio_ctx_ = avio_alloc_context(io_buffer, kIoBufferSize, 0, this,
                                   &ClipReader::on_read, nullptr, &ClipReader::on_seek);
    if (!avio_ctx_) {
        av_free(io_buffer);
        failed_ = true;
        return false;
    }

    fmt_ctx_ = avformat_alloc_context();
    if (!fmt_ctx_) {
        close();
        failed_ = true;
        return false;
    }
    fmt_ctx_->pb = avio_ctx_;
    fmt_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

    // On failure avformat_open_input frees the context (but not our AVIO).
    if (avformat_open_input(&fmt_ctx_, nullptr, nullptr, nullptr) < 0) {
        RCLCPP_WARN(logger(), "Could not probe clip (%zu bytes)", bytes_.size());
        fmt_ctx_ = nullptr;
        close();
        failed_ = true;
        return false;
    }
    if (avformat_find_stream_info(fmt_ctx_, nullptr) < 0) {
        RCLCPP_WARN(logger(), "No stream info in clip");
        close();
        failed_ = true;
        return false;
    }

    stream_index_ = av_find_best_stream(fmt_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_index_ < 0) {
        RCLCPP_WARN(logger(), "No video stream in clip");
        close();
        failed_ = true;
        return false;
    }
    AVStream* st = fmt_ctx_->streams[stream_index_];
    for (unsigned i = 0; i < fmt_ctx_->nb_streams; ++i)
        if (static_cast<int>(i) != stream_index_) fmt_ctx_->streams[i]->discard = AVDISCARD_ALL;

    const AVCodec* decoder = avcodec_find_decoder(st->codecpar->codec_id);
    if (!decoder) {
        RCLCPP_WARN(logger(), "No decoder for %s", avcodec_get_name(st->codecpar->codec_id));
        close();
        failed_ = true;
        return false;
    }
    codec_ctx_ = avcodec_alloc_context3(decoder);
    if (!codec_ctx_ || avcodec_parameters_to_context(codec_ctx_, st->codecpar) < 0
        || avcodec_open2(codec_ctx_, decoder, nullptr) < 0) {
        RCLCPP_WARN(logger(), "Could not open decoder %s", decoder->name);
        close();
        failed_ = true;
        return false;
    }

    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_ || !pkt_) {
        close();
        failed_ = true;
        return false;
    }
    start_ts_ = st->start_time;
    last_pts_ms_ = -1;
    flushing_ = false;
    return true;
}

bool ClipReader::read(DecodedFrame& out)
{
    if (!fmt_ctx_ || failed_) return false;

    for (;;) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == 0) {
            const bool ok = convert(frame_, out);
            av_frame_unref(frame_);
            if (!ok) {
                failed_ = true;
                return false;
            }
            return true;
        }
        if (ret == AVERROR_EOF) return false;
        if (ret != AVERROR(EAGAIN)) {
            failed_ = true;
            return false;
        }
        if (flushing_) return false;

        ret = av_read_frame(fmt_ctx_, pkt_);
        if (ret < 0) {
            // end of input: drain the decoder
            flushing_ = true;
            avcodec_send_packet(codec_ctx_, nullptr);
            continue;
        }
        if (pkt_->stream_index != stream_index_) {
            av_packet_unref(pkt_);
            continue;
        }
        ret = avcodec_send_packet(codec_ctx_, pkt_);
        av_packet_unref(pkt_);
        if (ret == AVERROR_INVALIDDATA) {
            RCLCPP_WARN(logger(), "Skipping corrupt packet");
            continue;
        }
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            failed_ = true;
            return false;
        }
    }
}

bool ClipReader::convert(const AVFrame* frame, DecodedFrame& out)
{
    if (frame->width <= 0 || frame->height <= 0) return false;

    sws_ctx_ = sws_getCachedContext(sws_ctx_, frame->width, frame->height,
                                    static_cast<AVPixelFormat>(frame->format),
                                    frame->width, frame->height, AV_PIX_FMT_BGRA,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) return false;

    cv::Mat bgra(frame->height, frame->width, CV_8UC4);
    uint8_t* dst[4] = { bgra.data, nullptr, nullptr, nullptr };
    int dst_stride[4] = { static_cast<int>(bgra.step), 0, 0, 0 };
    sws_scale(sws_ctx_, frame->data, frame->linesize, 0, frame->height, dst, dst_stride);

    int64_t ts = frame->best_effort_timestamp;
    if (ts == AV_NOPTS_VALUE) ts = frame->pts;

    int64_t pts_ms;
    if (ts == AV_NOPTS_VALUE) {
        pts_ms = last_pts_ms_ + 1;
    } else {
        if (start_ts_ == AV_NOPTS_VALUE) start_ts_ = ts;
        pts_ms = av_rescale_q(ts - start_ts_, fmt_ctx_->streams[stream_index_]->time_base,
                              AVRational{1, 1000});
    }
    // presentation order never goes backwards
    pts_ms = std::max(pts_ms, last_pts_ms_ < 0 ? int64_t{0} : last_pts_ms_);
    last_pts_ms_ = pts_ms;

    out.bgra = std::move(bgra);
    out.pts_ms = pts_ms;
    return true;
}

void ClipReader::close()
{
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
    avcodec_free_context(&codec_ctx_);
    if (fmt_ctx_) avformat_close_input(&fmt_ctx_);
    // AVFMT_FLAG_CUSTOM_IO: the AVIO context stays ours to free
    if (avio_ctx_) {
        av_freep(&avio_ctx_->buffer);
        avio_context_free(&avio_ctx_);
    }
    stream_index_ = -1;
}

std::vector<DecodedFrame> ClipReader::decode_all(const std::vector<uint8_t>& bytes)
{
    ClipReader reader(bytes);
    if (!reader.open())
        throw PipelineError(ErrorCode::DecodeFailure, "clip could not be opened");

    std::vector<DecodedFrame> frames;
    DecodedFrame f;
    while (reader.read(f)) frames.push_back(std::move(f));

    if (frames.empty())
        throw PipelineError(ErrorCode::DecodeFailure, "clip produced zero frames");
    return frames;
}

} // namespace motion_clip
