#include "render/video_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace chromaflow {

namespace {

std::string lowercase_extension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

AVPixelFormat choose_pixel_format(const AVCodec* codec, bool gif_output) {
    const AVPixelFormat fallback = gif_output ? AV_PIX_FMT_RGB8 : AV_PIX_FMT_YUV420P;
    if (!codec) {
        return fallback;
    }

    const void* raw_formats = nullptr;
    int num_formats = 0;
    const int ret = avcodec_get_supported_config(
        nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &raw_formats, &num_formats);
    if (ret < 0 || !raw_formats || num_formats <= 0) {
        return fallback;
    }

    const auto* pix_fmts = static_cast<const AVPixelFormat*>(raw_formats);
    const auto supported = [&](AVPixelFormat fmt) {
        return std::find(pix_fmts, pix_fmts + num_formats, fmt) != pix_fmts + num_formats;
    };

    if (gif_output) {
        for (AVPixelFormat pf : {AV_PIX_FMT_RGB8, AV_PIX_FMT_BGR8, AV_PIX_FMT_PAL8}) {
            if (supported(pf)) return pf;
        }
    } else if (supported(AV_PIX_FMT_YUV420P)) {
        return AV_PIX_FMT_YUV420P;
    }

    return pix_fmts[0];
}

std::vector<const AVCodec*> encoder_candidates(const std::string& preferred, bool gif_output) {
    std::vector<const AVCodec*> out;
    const auto add = [&out](const AVCodec* codec) {
        if (!codec) return;
        for (const AVCodec* existing : out) {
            if (std::strcmp(existing->name, codec->name) == 0) return;
        }
        out.push_back(codec);
    };

    if (gif_output) {
        add(avcodec_find_encoder(AV_CODEC_ID_GIF));
        return out;
    }
    add(avcodec_find_encoder_by_name(preferred.c_str()));
    add(avcodec_find_encoder_by_name("libx264"));
    add(avcodec_find_encoder_by_name("libopenh264"));
    add(avcodec_find_encoder(AV_CODEC_ID_MPEG4));
    add(avcodec_find_encoder(AV_CODEC_ID_H264));
    return out;
}

}  // namespace

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() {
    close();
}

bool VideoEncoder::fail(const std::string& message) {
    last_error_ = message;
    return false;
}

bool VideoEncoder::open(const std::string& filename, const Config& config) {
    close();
    config_ = config;
    config_.fps = std::max(1, config_.fps);
    filename_ = filename;
    last_error_.clear();
    output_is_gif_ = lowercase_extension(filename) == ".gif";

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, filename.c_str());
    if (ret < 0 || !format_ctx_) {
        format_ctx_ = nullptr;
        return fail("unsupported output container: " + filename);
    }
    return true;
}

bool VideoEncoder::start(int frame_width, int frame_height) {
    if (config_.width <= 0) config_.width = frame_width;
    if (config_.height <= 0) config_.height = frame_height;
    if (!output_is_gif_) {
        config_.width &= ~1;
        config_.height &= ~1;
    }
    if (config_.width <= 0 || config_.height <= 0) {
        return fail("frame too small to encode");
    }

    if (!init_codec()) {
        return false;
    }

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
        if (avio_open(&format_ctx_->pb, filename_.c_str(), AVIO_FLAG_WRITE) < 0) {
            return fail("cannot open " + filename_ + " for writing");
        }
    }

    if (avformat_write_header(format_ctx_, nullptr) < 0) {
        return fail("failed to write container header");
    }
    header_written_ = true;
    return true;
}

bool VideoEncoder::init_codec() {
    const std::vector<const AVCodec*> candidates = encoder_candidates(config_.codec, output_is_gif_);
    if (candidates.empty()) {
        return fail("no usable video encoder");
    }

    const AVCodec* opened = nullptr;
    for (const AVCodec* codec : candidates) {
        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) continue;

        codec_ctx_->width = config_.width;
        codec_ctx_->height = config_.height;
        codec_ctx_->time_base = {1, config_.fps};
        codec_ctx_->framerate = {config_.fps, 1};
        codec_ctx_->pix_fmt = choose_pixel_format(codec, output_is_gif_);
        codec_ctx_->gop_size = config_.fps;
        if (!output_is_gif_) {
            codec_ctx_->bit_rate = config_.bitrate;
        }
        if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }
        if (std::strcmp(codec->name, "libx264") == 0) {
            av_opt_set(codec_ctx_->priv_data, "preset", config_.preset.c_str(), 0);
        }

        if (avcodec_open2(codec_ctx_, codec, nullptr) >= 0) {
            opened = codec;
            break;
        }
        avcodec_free_context(&codec_ctx_);
    }
    if (!opened) {
        return fail("no encoder accepted " + std::to_string(config_.width) + "x" +
                    std::to_string(config_.height));
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) return fail("failed to allocate output stream");
    stream_->time_base = codec_ctx_->time_base;
    if (avcodec_parameters_from_context(stream_->codecpar, codec_ctx_) < 0) {
        return fail("failed to copy codec parameters");
    }

    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_ || !pkt_) return fail("out of memory");

    frame_->format = codec_ctx_->pix_fmt;
    frame_->width = codec_ctx_->width;
    frame_->height = codec_ctx_->height;
    if (av_frame_get_buffer(frame_, 0) < 0) {
        return fail("failed to allocate frame buffer");
    }
    return true;
}

bool VideoEncoder::ensure_scaler(int src_width, int src_height) {
    if (sws_ctx_ && src_width == sws_src_width_ && src_height == sws_src_height_) {
        return true;
    }
    sws_freeContext(sws_ctx_);
    sws_ctx_ = sws_getContext(
        src_width, src_height, AV_PIX_FMT_RGBA,
        config_.width, config_.height, codec_ctx_->pix_fmt,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );
    sws_src_width_ = src_width;
    sws_src_height_ = src_height;
    return sws_ctx_ != nullptr || fail("failed to create scaler");
}

bool VideoEncoder::write_frame(const FrameBuffer& frame) {
    if (!is_open() || frame.empty()) return false;
    if (!header_written_ && !start(frame.width(), frame.height())) {
        return false;
    }
    if (!ensure_scaler(frame.width(), frame.height())) {
        return false;
    }
    if (av_frame_make_writable(frame_) < 0) {
        return fail("frame not writable");
    }

    const uint8_t* src_data[1] = {frame.data()};
    const int src_linesize[1] = {frame.width() * 4};
    sws_scale(sws_ctx_, src_data, src_linesize, 0, frame.height(), frame_->data, frame_->linesize);

    frame_->pts = pts_++;
    if (avcodec_send_frame(codec_ctx_, frame_) < 0) {
        return fail("encoder rejected frame");
    }
    return drain_packets();
}

bool VideoEncoder::drain_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) return fail("encoding failed");

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        if (av_interleaved_write_frame(format_ctx_, pkt_) < 0) {
            return fail("failed to write packet");
        }
    }
}

void VideoEncoder::close() {
    if (format_ctx_) {
        if (header_written_) {
            avcodec_send_frame(codec_ctx_, nullptr);
            if (!drain_packets() || av_write_trailer(format_ctx_) < 0) {
                last_error_ = "failed to finalize " + filename_;
            }
        }
        if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&format_ctx_->pb);
        }
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }

    avcodec_free_context(&codec_ctx_);
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
    stream_ = nullptr;
    sws_src_width_ = 0;
    sws_src_height_ = 0;
    pts_ = 0;
    header_written_ = false;
}

}
