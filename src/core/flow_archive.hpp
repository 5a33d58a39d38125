#pragma once

#include "core/types.hpp"
#include "flow/flow_field.hpp"
#include <cstdio>
#include <string>
#include <vector>
#include <cstdint>

namespace chromaflow {

#pragma pack(push, 1)
struct FlowArchiveHeader {
    char magic[8] = {'C', 'F', 'L', 'O', 'W', '\0', '\0', '\0'};
    uint32_t version = 1;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t frame_count = 0;
    uint32_t fps = 30;
    char config_hash[9] = {0};
    uint32_t reserved[4] = {0};
};

struct FlowArchiveFrameHeader {
    uint32_t frame_index = 0;
    uint32_t data_size = 0;
    uint32_t raw_size = 0;
    uint32_t flags = 0;
};
#pragma pack(pop)

constexpr uint32_t FLOW_FRAME_FULL = 1u << 0;
// Payload is the bitwise XOR against the previous frame's planes.
constexpr uint32_t FLOW_FRAME_DELTA = 1u << 1;

// Payload: the x plane then the y plane, binary16 bit patterns, row-major.
class FlowArchiveWriter {
public:
    FlowArchiveWriter();
    ~FlowArchiveWriter();

    FlowArchiveWriter(const FlowArchiveWriter&) = delete;
    FlowArchiveWriter& operator=(const FlowArchiveWriter&) = delete;

    // keyframe_interval <= 1 writes every frame in full.
    bool open(const std::string& path, int width, int height, int fps,
              const std::string& config_hash, int keyframe_interval = 30);
    bool write_frame(uint32_t frame_index, const FlowField& field);
    void close();

    uint32_t frame_count() const { return frame_count_; }
    bool is_open() const { return file_ != nullptr; }

private:
    FILE* file_ = nullptr;
    uint32_t frame_count_ = 0;
    int width_ = 0;
    int height_ = 0;
    int keyframe_interval_ = 30;
    std::vector<uint16_t> last_planes_;
    std::vector<uint16_t> payload_;
    std::vector<uint8_t> compress_buffer_;
};

class FlowArchiveReader {
public:
    FlowArchiveReader();
    ~FlowArchiveReader();

    FlowArchiveReader(const FlowArchiveReader&) = delete;
    FlowArchiveReader& operator=(const FlowArchiveReader&) = delete;

    bool open(const std::string& path);
    // Random access; delta frames are rebuilt from the preceding full frame.
    bool read_frame(uint32_t frame_index, FlowField& field);
    void close();

    const FlowArchiveHeader& header() const { return header_; }
    uint32_t frame_count() const { return static_cast<uint32_t>(frames_.size()); }
    int width() const { return static_cast<int>(header_.width); }
    int height() const { return static_cast<int>(header_.height); }
    int fps() const { return static_cast<int>(header_.fps); }
    std::string config_hash() const { return std::string(header_.config_hash, 8); }
    bool is_open() const { return file_ != nullptr; }

private:
    struct FrameEntry {
        uint64_t offset = 0;
        FlowArchiveFrameHeader header;
    };

    FILE* file_ = nullptr;
    FlowArchiveHeader header_;
    std::vector<FrameEntry> frames_;
    std::vector<uint16_t> planes_;
    std::vector<uint16_t> scratch_;
    int64_t decoded_index_ = -1;

    bool read_header();
    bool build_frame_index();
    bool decode_payload(const FrameEntry& entry, std::vector<uint16_t>& out);
};

}
