#pragma once

#include "core/types.hpp"
#include <string>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;
}

namespace chromaflow {

// Writes visualized flow frames to .mp4/.gif through libavformat. The codec
// is opened lazily on the first frame; a zero width/height in the config
// takes the size of that frame (rounded down to even for YUV 4:2:0).
class VideoEncoder {
public:
    struct Config {
        int width = 0;
        int height = 0;
        int fps = 30;
        int bitrate = 4000000;
        std::string codec = "libx264";
        std::string preset = "medium";
    };

    VideoEncoder();
    ~VideoEncoder();

    VideoEncoder(const VideoEncoder&) = delete;
    VideoEncoder& operator=(const VideoEncoder&) = delete;

    bool open(const std::string& filename, const Config& config);
    void close();
    bool write_frame(const FrameBuffer& frame);
    bool is_open() const { return format_ctx_ != nullptr; }
    int64_t frames_written() const { return pts_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool start(int frame_width, int frame_height);
    bool init_codec();
    bool ensure_scaler(int src_width, int src_height);
    bool drain_packets();
    bool fail(const std::string& message);

    Config config_;
    std::string filename_;
    std::string last_error_;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    int sws_src_width_ = 0;
    int sws_src_height_ = 0;
    int64_t pts_ = 0;
    bool header_written_ = false;
    bool output_is_gif_ = false;
};

}
