#include "core/flow_archive.hpp"
#include <zstd.h>
#include <cstddef>
#include <cstring>
#include <algorithm>
#include <climits>

namespace chromaflow {

constexpr size_t COMPRESS_BUFFER_SIZE = 256 * 1024;
constexpr int ZSTD_COMPRESSION_LEVEL = 3;
constexpr uint32_t FLOW_ARCHIVE_VERSION = 1;

FlowArchiveWriter::FlowArchiveWriter() {
    compress_buffer_.resize(COMPRESS_BUFFER_SIZE);
}

FlowArchiveWriter::~FlowArchiveWriter() {
    close();
}

bool FlowArchiveWriter::open(const std::string& path, int width, int height, int fps,
                             const std::string& config_hash, int keyframe_interval) {
    close();
    if (width <= 0 || height <= 0) return false;

    width_ = width;
    height_ = height;
    keyframe_interval_ = std::max(1, keyframe_interval);
    frame_count_ = 0;
    last_planes_.clear();

    file_ = fopen(path.c_str(), "wb");
    if (!file_) return false;

    FlowArchiveHeader hdr;
    hdr.version = FLOW_ARCHIVE_VERSION;
    hdr.width = static_cast<uint32_t>(width);
    hdr.height = static_cast<uint32_t>(height);
    hdr.fps = static_cast<uint32_t>(std::max(fps, 1));
    std::strncpy(hdr.config_hash, config_hash.c_str(), 8);
    hdr.config_hash[8] = '\0';

    if (fwrite(&hdr, sizeof(hdr), 1, file_) != 1) {
        fclose(file_);
        file_ = nullptr;
        return false;
    }

    return true;
}

bool FlowArchiveWriter::write_frame(uint32_t frame_index, const FlowField& field) {
    if (!file_ || field.width() != width_ || field.height() != height_) {
        return false;
    }

    const size_t plane = field.plane_elements();
    payload_.resize(plane * 2);
    std::memcpy(payload_.data(), field.x_plane(), plane * sizeof(uint16_t));
    std::memcpy(payload_.data() + plane, field.y_plane(), plane * sizeof(uint16_t));

    const bool keyframe = last_planes_.size() != payload_.size() ||
                          frame_count_ % static_cast<uint32_t>(keyframe_interval_) == 0;

    std::vector<uint16_t> delta;
    const uint16_t* src = payload_.data();
    if (!keyframe) {
        delta.resize(payload_.size());
        for (size_t i = 0; i < payload_.size(); ++i) {
            delta[i] = static_cast<uint16_t>(payload_[i] ^ last_planes_[i]);
        }
        src = delta.data();
    }

    const size_t src_size = payload_.size() * sizeof(uint16_t);
    const size_t bound = ZSTD_compressBound(src_size);
    if (bound > compress_buffer_.size()) {
        compress_buffer_.resize(bound);
    }

    const size_t compressed_size = ZSTD_compress(
        compress_buffer_.data(), compress_buffer_.size(),
        src, src_size,
        ZSTD_COMPRESSION_LEVEL
    );

    if (ZSTD_isError(compressed_size)) {
        return false;
    }

    FlowArchiveFrameHeader frame_hdr;
    frame_hdr.frame_index = frame_index;
    frame_hdr.data_size = static_cast<uint32_t>(compressed_size);
    frame_hdr.raw_size = static_cast<uint32_t>(src_size);
    frame_hdr.flags = keyframe ? FLOW_FRAME_FULL : FLOW_FRAME_DELTA;

    if (fwrite(&frame_hdr, sizeof(frame_hdr), 1, file_) != 1) {
        return false;
    }

    if (fwrite(compress_buffer_.data(), 1, compressed_size, file_) != compressed_size) {
        return false;
    }

    last_planes_ = payload_;
    frame_count_++;

    FlowArchiveHeader hdr_update;
    hdr_update.frame_count = frame_count_;
    if (fseek(file_, offsetof(FlowArchiveHeader, frame_count), SEEK_SET) != 0) {
        return false;
    }
    if (fwrite(&hdr_update.frame_count, sizeof(hdr_update.frame_count), 1, file_) != 1) {
        return false;
    }
    return fseek(file_, 0, SEEK_END) == 0;
}

void FlowArchiveWriter::close() {
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    frame_count_ = 0;
    last_planes_.clear();
}

FlowArchiveReader::FlowArchiveReader() = default;

FlowArchiveReader::~FlowArchiveReader() {
    close();
}

bool FlowArchiveReader::open(const std::string& path) {
    close();

    file_ = fopen(path.c_str(), "rb");
    if (!file_) return false;

    if (!read_header() || !build_frame_index()) {
        fclose(file_);
        file_ = nullptr;
        return false;
    }

    return true;
}

bool FlowArchiveReader::read_header() {
    if (fread(&header_, sizeof(header_), 1, file_) != 1) {
        return false;
    }

    if (std::memcmp(header_.magic, "CFLOW\0\0\0", 8) != 0) {
        return false;
    }
    if (header_.version != FLOW_ARCHIVE_VERSION || header_.width == 0 || header_.height == 0) {
        return false;
    }
    // Dimensions feed int accessors and a 32-bit raw_size per frame.
    if (header_.width > INT_MAX || header_.height > INT_MAX) {
        return false;
    }
    const uint64_t raw = static_cast<uint64_t>(header_.width) * header_.height * 2u * sizeof(uint16_t);
    if (raw > UINT32_MAX) {
        return false;
    }

    return true;
}

bool FlowArchiveReader::build_frame_index() {
    frames_.clear();

    if (fseek(file_, sizeof(FlowArchiveHeader), SEEK_SET) != 0) {
        return false;
    }

    const uint64_t expected_raw =
        static_cast<uint64_t>(header_.width) * header_.height * 2u * sizeof(uint16_t);
    FlowArchiveFrameHeader frame_hdr;
    while (fread(&frame_hdr, sizeof(frame_hdr), 1, file_) == 1) {
        if (static_cast<uint64_t>(frame_hdr.raw_size) != expected_raw) {
            return false;
        }
        FrameEntry entry;
        entry.offset = static_cast<uint64_t>(ftell(file_));
        entry.header = frame_hdr;

        // A truncated trailing frame is dropped.
        if (fseek(file_, frame_hdr.data_size, SEEK_CUR) != 0) {
            break;
        }
        const long end = ftell(file_);
        if (fseek(file_, 0, SEEK_END) != 0) break;
        const long file_end = ftell(file_);
        if (end > file_end) break;
        if (fseek(file_, end, SEEK_SET) != 0) break;

        frames_.push_back(entry);
    }

    // A stream of only deltas cannot be decoded.
    if (!frames_.empty() && (frames_.front().header.flags & FLOW_FRAME_FULL) == 0) {
        return false;
    }

    return fseek(file_, sizeof(FlowArchiveHeader), SEEK_SET) == 0;
}

bool FlowArchiveReader::decode_payload(const FrameEntry& entry, std::vector<uint16_t>& out) {
    if (fseek(file_, static_cast<long>(entry.offset), SEEK_SET) != 0) {
        return false;
    }

    std::vector<uint8_t> compressed(entry.header.data_size);
    if (fread(compressed.data(), 1, compressed.size(), file_) != compressed.size()) {
        return false;
    }

    out.resize(entry.header.raw_size / sizeof(uint16_t));
    const size_t result = ZSTD_decompress(
        out.data(), entry.header.raw_size,
        compressed.data(), compressed.size()
    );

    if (ZSTD_isError(result)) {
        return false;
    }
    return result == entry.header.raw_size;
}

bool FlowArchiveReader::read_frame(uint32_t frame_index, FlowField& field) {
    if (!file_ || frame_index >= frames_.size()) {
        return false;
    }

    const int64_t target = static_cast<int64_t>(frame_index);
    auto is_full = [this](int64_t i) {
        return (frames_[static_cast<size_t>(i)].header.flags & FLOW_FRAME_FULL) != 0;
    };

    int64_t start = target;
    if (decoded_index_ >= 0 && decoded_index_ <= target) {
        // Continue from the decoded state unless a full frame is closer.
        start = decoded_index_ + 1;
        for (int64_t k = target; k > decoded_index_; --k) {
            if (is_full(k)) {
                start = k;
                break;
            }
        }
    } else {
        while (start > 0 && !is_full(start)) {
            --start;
        }
    }

    for (int64_t i = start; i <= static_cast<int64_t>(frame_index); ++i) {
        const FrameEntry& entry = frames_[static_cast<size_t>(i)];
        if (entry.header.flags & FLOW_FRAME_FULL) {
            if (!decode_payload(entry, planes_)) {
                decoded_index_ = -1;
                return false;
            }
        } else {
            if (!decode_payload(entry, scratch_) || scratch_.size() != planes_.size()) {
                decoded_index_ = -1;
                return false;
            }
            for (size_t k = 0; k < planes_.size(); ++k) {
                planes_[k] = static_cast<uint16_t>(planes_[k] ^ scratch_[k]);
            }
        }
        decoded_index_ = i;
    }

    field = FlowField(width(), height());
    const size_t plane = field.plane_elements();
    std::memcpy(field.x_plane(), planes_.data(), plane * sizeof(uint16_t));
    std::memcpy(field.y_plane(), planes_.data() + plane, plane * sizeof(uint16_t));
    return true;
}

void FlowArchiveReader::close() {
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    frames_.clear();
    planes_.clear();
    decoded_index_ = -1;
}

}
