#include "core/frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"

#ifdef CHROMAFLOW_USE_OPENCV
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#else
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}
#endif

namespace chromaflow {

#ifdef CHROMAFLOW_USE_OPENCV
bool FrameSource::mat_to_frame_buffer(const cv::Mat& mat, FrameBuffer& out) {
    if (mat.empty()) return false;

    cv::Mat rgba;
    switch (mat.channels()) {
        case 1: cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA); break;
        default: return false;
    }
    if (rgba.depth() != CV_8U) {
        rgba.convertTo(rgba, CV_8U);
    }

    if (out.width() != rgba.cols || out.height() != rgba.rows) {
        out = FrameBuffer(rgba.cols, rgba.rows);
    }
    const size_t row_bytes = static_cast<size_t>(rgba.cols) * 4;
    for (int y = 0; y < rgba.rows; ++y) {
        std::memcpy(out.data() + y * row_bytes, rgba.ptr<uint8_t>(y), row_bytes);
    }
    return true;
}
#endif

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

bool has_sequence_pattern(const std::string& name) {
    if (name.find('*') != std::string::npos || name.find('?') != std::string::npos) {
        return true;
    }
    static const std::regex printf_index("%0?[0-9]*d");
    return std::regex_search(name, printf_index);
}

// Wildcards and a printf integer (%d, %04d) to an anchored regex.
std::string sequence_pattern_to_regex(const std::string& pattern) {
    std::string regex = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '%') {
            size_t j = i + 1;
            std::string width;
            while (j < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[j]))) {
                width += pattern[j++];
            }
            if (j < pattern.size() && pattern[j] == 'd') {
                const int digits = width.empty() ? 0 : std::stoi(width);
                regex += digits > 0 ? "[0-9]{" + std::to_string(digits) + "}" : "[0-9]+";
                i = j;
                continue;
            }
        }
        switch (c) {
            case '*': regex += ".*"; break;
            case '?': regex += "."; break;
            case '.': case '\\': case '+': case '^': case '$': case '(': case ')':
            case '[': case ']': case '{': case '}': case '|': case '%':
                regex += '\\';
                regex += c;
                break;
            default:
                regex += c;
                break;
        }
    }
    regex += "$";
    return regex;
}

bool load_image_stb(const std::string& path, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!data) {
        return false;
    }
    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }

    out = FrameBuffer(w, h);
    std::memcpy(out.data(), data, out.byte_size());
    stbi_image_free(data);
    return true;
}

#ifndef CHROMAFLOW_USE_OPENCV
// Demux + decode + convert to RGBA. Owns every libav object it allocates.
class FFmpegDecoder {
public:
    FFmpegDecoder() = default;
    ~FFmpegDecoder() { close(); }

    FFmpegDecoder(const FFmpegDecoder&) = delete;
    FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

    bool open(const std::string& uri, Size& size, double& fps);
    bool next(FrameBuffer& out);
    bool is_open() const { return codec_ctx_ != nullptr; }

    void close() {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = nullptr;
        av_frame_free(&frame_);
        av_packet_free(&packet_);
        avcodec_free_context(&codec_ctx_);
        avformat_close_input(&format_ctx_);
        stream_idx_ = -1;
        eof_ = false;
        sws_width_ = 0;
        sws_height_ = 0;
        sws_format_ = AV_PIX_FMT_NONE;
    }

private:
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    int sws_width_ = 0;
    int sws_height_ = 0;
    AVPixelFormat sws_format_ = AV_PIX_FMT_NONE;
    int stream_idx_ = -1;
    bool eof_ = false;

    bool convert_current(FrameBuffer& out);
    bool feed_decoder();
};

bool FFmpegDecoder::open(const std::string& uri, Size& size, double& fps) {
    close();

    const AVInputFormat* input_fmt = is_image_path(uri) ? av_find_input_format("image2") : nullptr;
    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "probesize", "5000000", 0);
    av_dict_set(&opts, "analyzeduration", "5000000", 0);
    const int open_ret = avformat_open_input(&format_ctx_, uri.c_str(), input_fmt, &opts);
    av_dict_free(&opts);
    if (open_ret < 0) {
        format_ctx_ = nullptr;
        return false;
    }
    if (avformat_find_stream_info(format_ctx_, nullptr) < 0) {
        close();
        return false;
    }

    const AVCodec* codec = nullptr;
    stream_idx_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (stream_idx_ < 0 || !codec) {
        close();
        return false;
    }

    AVStream* stream = format_ctx_->streams[stream_idx_];
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_ ||
        avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0 ||
        avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        close();
        return false;
    }

    size.width = codec_ctx_->width;
    size.height = codec_ctx_->height;

    const AVRational fr = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    fps = (fr.num > 0 && fr.den > 0) ? av_q2d(fr) : 30.0;
    if (fps <= 0.0) fps = 30.0;

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        close();
        return false;
    }
    return true;
}

bool FFmpegDecoder::convert_current(FrameBuffer& out) {
    const int w = frame_->width;
    const int h = frame_->height;
    const AVPixelFormat fmt = static_cast<AVPixelFormat>(frame_->format);
    if (w <= 0 || h <= 0) return false;

    if (!sws_ctx_ || w != sws_width_ || h != sws_height_ || fmt != sws_format_) {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = sws_getContext(w, h, fmt, w, h, AV_PIX_FMT_RGBA,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!sws_ctx_) return false;
        sws_width_ = w;
        sws_height_ = h;
        sws_format_ = fmt;
    }

    if (out.width() != w || out.height() != h) {
        out = FrameBuffer(w, h);
    }
    uint8_t* dst_data[4] = {out.data(), nullptr, nullptr, nullptr};
    int dst_linesize[4] = {w * 4, 0, 0, 0};
    sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, h, dst_data, dst_linesize);
    return true;
}

bool FFmpegDecoder::feed_decoder() {
    while (true) {
        const int read_ret = av_read_frame(format_ctx_, packet_);
        if (read_ret < 0) {
            eof_ = true;
            const int flush_ret = avcodec_send_packet(codec_ctx_, nullptr);
            return flush_ret >= 0 || flush_ret == AVERROR_EOF;
        }
        if (packet_->stream_index != stream_idx_) {
            av_packet_unref(packet_);
            continue;
        }
        const int send_ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        return send_ret >= 0 || send_ret == AVERROR(EAGAIN);
    }
}

bool FFmpegDecoder::next(FrameBuffer& out) {
    if (!is_open()) return false;
    while (true) {
        const int recv = avcodec_receive_frame(codec_ctx_, frame_);
        if (recv == 0) {
            const bool ok = convert_current(out);
            av_frame_unref(frame_);
            return ok;
        }
        if (recv == AVERROR_EOF) return false;
        if (recv != AVERROR(EAGAIN)) return false;
        if (eof_) return false;
        if (!feed_decoder()) return false;
    }
}

bool decode_first_frame(const std::string& uri, FrameBuffer& out) {
    FFmpegDecoder dec;
    Size size;
    double fps = 0.0;
    return dec.open(uri, size, fps) && dec.next(out);
}
#endif

bool load_still(const std::string& path, FrameBuffer& out) {
#ifdef CHROMAFLOW_USE_OPENCV
    cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (!image.empty()) {
        return FrameSource::mat_to_frame_buffer(image, out);
    }
    return load_image_stb(path, out);
#else
    return load_image_stb(path, out) || decode_first_frame(path, out);
#endif
}

}  // namespace

bool is_image_path(const std::string& path) {
    const std::string lower = to_lower_copy(path);
    for (const char* ext : {".png", ".jpg", ".jpeg", ".bmp", ".gif", ".tga", ".tiff", ".webp", ".ppm", ".pgm"}) {
        if (lower.ends_with(ext)) return true;
    }
    return false;
}

#ifndef CHROMAFLOW_USE_OPENCV
struct VideoFileSource::Impl {
    FFmpegDecoder decoder;
};
#endif

VideoFileSource::VideoFileSource() {
#ifndef CHROMAFLOW_USE_OPENCV
    impl_ = std::make_unique<Impl>();
#endif
}

VideoFileSource::~VideoFileSource() = default;

bool VideoFileSource::open(const std::string& uri) {
#ifdef CHROMAFLOW_USE_OPENCV
    cap_.open(uri);
    if (!cap_.isOpened()) return false;

    fps_ = cap_.get(cv::CAP_PROP_FPS);
    if (fps_ <= 0) fps_ = 30.0;

    size_.width = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    size_.height = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    return true;
#else
    return impl_->decoder.open(uri, size_, fps_);
#endif
}

bool VideoFileSource::read(FrameBuffer& out) {
#ifdef CHROMAFLOW_USE_OPENCV
    cv::Mat frame;
    if (!cap_.read(frame)) return false;
    return mat_to_frame_buffer(frame, out);
#else
    return impl_->decoder.next(out);
#endif
}

bool VideoFileSource::is_open() const {
#ifdef CHROMAFLOW_USE_OPENCV
    return cap_.isOpened();
#else
    return impl_->decoder.is_open();
#endif
}

bool ImageSource::open(const std::string& uri) {
    image_ = FrameBuffer();
    sent_ = false;
    return load_still(uri, image_);
}

bool ImageSource::read(FrameBuffer& out) {
    if (sent_ || image_.empty()) return false;
    out = image_;
    sent_ = true;
    return true;
}

bool ImageSequenceSource::open(const std::string& uri) {
    files_.clear();
    current_index_ = 0;
    size_ = {};

    if (uri.empty()) return false;

    namespace fs = std::filesystem;
    const fs::path path(uri);
    const fs::path directory = path.has_parent_path() ? path.parent_path() : fs::path(".");
    const std::string pattern = path.filename().string();

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return false;
    }

    const std::regex matcher(sequence_pattern_to_regex(pattern), std::regex::icase);
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) continue;
        if (std::regex_match(entry.path().filename().string(), matcher)) {
            files_.push_back(entry.path().string());
        }
    }
    std::sort(files_.begin(), files_.end());

    // Skip leading unreadable files so frame_size() is known after open.
    while (!files_.empty()) {
        FrameBuffer first;
        if (load_still(files_.front(), first)) {
            size_ = first.size();
            return true;
        }
        std::cerr << "Warning: skipping unreadable image " << files_.front() << "\n";
        files_.erase(files_.begin());
    }
    return false;
}

bool ImageSequenceSource::read(FrameBuffer& out) {
    while (current_index_ < files_.size()) {
        const std::string& file = files_[current_index_++];
        if (load_still(file, out)) {
            return true;
        }
        std::cerr << "Warning: skipping unreadable image " << file << "\n";
    }
    return false;
}

PipeSource::PipeSource() : input_(&std::cin) {}

PipeSource::PipeSource(std::istream& input) : input_(&input) {}

bool PipeSource::open(const std::string& uri) {
    opened_ = false;
    width_ = 0;
    height_ = 0;
    channels_ = 3;
    fps_ = 30.0;

    if (uri.rfind("pipe:", 0) != 0) return false;

    const auto parts = split(uri.substr(5), ':');
    if (parts.empty()) return false;

    const std::string& size_part = parts[0];
    const size_t x_pos = size_part.find('x');
    if (x_pos == std::string::npos) return false;

    try {
        width_ = std::stoi(size_part.substr(0, x_pos));
        height_ = std::stoi(size_part.substr(x_pos + 1));
        if (parts.size() >= 3) {
            fps_ = std::stod(parts[2]);
        }
    } catch (const std::exception&) {
        return false;
    }
    if (width_ <= 0 || height_ <= 0 || fps_ <= 0.0) return false;

    if (parts.size() >= 2) {
        const std::string fmt = to_lower_copy(parts[1]);
        if (fmt == "rgb") {
            channels_ = 3;
        } else if (fmt == "rgba") {
            channels_ = 4;
        } else {
            return false;
        }
    }

    opened_ = true;
    return true;
}

bool PipeSource::read(FrameBuffer& out) {
    if (!opened_) return false;

    const size_t pixels = static_cast<size_t>(width_) * height_;
    buffer_.resize(pixels * channels_);
    input_->read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    if (static_cast<size_t>(input_->gcount()) != buffer_.size()) {
        return false;
    }

    if (out.width() != width_ || out.height() != height_) {
        out = FrameBuffer(width_, height_);
    }
    if (channels_ == 4) {
        std::memcpy(out.data(), buffer_.data(), buffer_.size());
        return true;
    }

    uint8_t* dst = out.data();
    for (size_t i = 0; i < pixels; ++i) {
        dst[i * 4] = buffer_[i * 3];
        dst[i * 4 + 1] = buffer_[i * 3 + 1];
        dst[i * 4 + 2] = buffer_[i * 3 + 2];
        dst[i * 4 + 3] = 255;
    }
    return true;
}

std::unique_ptr<FrameSource> create_source(const std::string& uri) {
    if (uri.rfind("pipe:", 0) == 0) {
        return std::make_unique<PipeSource>();
    }

    if (has_sequence_pattern(std::filesystem::path(uri).filename().string())) {
        return std::make_unique<ImageSequenceSource>();
    }

    if (is_image_path(uri)) {
        return std::make_unique<ImageSource>();
    }

    return std::make_unique<VideoFileSource>();
}

}
