#pragma once

#include "flow/flow_types.hpp"

namespace chromaflow {

// image_size is the per-axis pixel size in texture units; its sign is ignored.
inline NormalizedVector to_normalized(const PixelVector& pixels, const Vec2& image_size) {
    return (pixels * image_size.abs()).clamped(-1.0f, 1.0f);
}

inline PixelVector to_pixel(const NormalizedVector& normalized, const Vec2& image_size) {
    return normalized / image_size.abs();
}

}
