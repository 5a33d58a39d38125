#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#ifdef CHROMAFLOW_USE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace chromaflow {

// Sequential RGBA8 frames from a video, image, image sequence or raw pipe.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool open(const std::string& uri) = 0;
    virtual bool read(FrameBuffer& out) = 0;
    virtual double fps() const = 0;
    virtual Size frame_size() const = 0;
    virtual bool is_open() const = 0;
    virtual const char* kind() const = 0;

#ifdef CHROMAFLOW_USE_OPENCV
    static bool mat_to_frame_buffer(const cv::Mat& mat, FrameBuffer& out);
#endif
};

class VideoFileSource : public FrameSource {
public:
    VideoFileSource();
    ~VideoFileSource() override;

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return size_; }
    bool is_open() const override;
    const char* kind() const override { return "video"; }

private:
#ifdef CHROMAFLOW_USE_OPENCV
    cv::VideoCapture cap_;
#else
    struct Impl;
    std::unique_ptr<Impl> impl_;
#endif
    double fps_ = 30.0;
    Size size_;
};

// A single still; yields one frame.
class ImageSource : public FrameSource {
public:
    ImageSource() = default;

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return 0.0; }
    Size frame_size() const override { return image_.size(); }
    bool is_open() const override { return !image_.empty(); }
    const char* kind() const override { return "image"; }

private:
    FrameBuffer image_;
    bool sent_ = false;
};

// Files in one directory matching a wildcard ("frames/*.png") or a printf
// style index ("frames/img_%04d.png"), read in lexicographic order.
class ImageSequenceSource : public FrameSource {
public:
    explicit ImageSequenceSource(double fps = 30.0) : fps_(fps) {}

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return size_; }
    bool is_open() const override { return !files_.empty(); }
    const char* kind() const override { return "sequence"; }

    const std::vector<std::string>& files() const { return files_; }

private:
    std::vector<std::string> files_;
    std::size_t current_index_ = 0;
    Size size_;
    double fps_;
};

// Raw interleaved frames, uri "pipe:WxH[:rgb|rgba[:fps]]". Reads stdin
// unless another stream is supplied.
class PipeSource : public FrameSource {
public:
    PipeSource();
    explicit PipeSource(std::istream& input);

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return {width_, height_}; }
    bool is_open() const override { return opened_; }
    const char* kind() const override { return "pipe"; }

    int channels() const { return channels_; }

private:
    std::istream* input_;
    bool opened_ = false;
    int width_ = 0;
    int height_ = 0;
    int channels_ = 3;
    double fps_ = 30.0;
    std::vector<uint8_t> buffer_;
};

bool is_image_path(const std::string& path);

std::unique_ptr<FrameSource> create_source(const std::string& uri);

}
