#pragma once

#include "core/types.hpp"

namespace chromaflow {

// Motion vector in fixed-range units: normalized * FIXED_RANGE_MAX.
using EncodedVector = Vec2;
// Flow in texture-coordinate units, [-1, 1].
using NormalizedVector = Vec2;
// Motion or derivative in image pixels.
using PixelVector = Vec2;

struct ColorSample {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    ColorSample() = default;
    ColorSample(float r, float g, float b) : r(r), g(g), b(b) {}

    ColorSample operator+(const ColorSample& o) const { return {r + o.r, g + o.g, b + o.b}; }
    ColorSample operator*(float s) const { return {r * s, g * s, b * s}; }
};

// Two angular chromaticity coordinates, each in [0, 1].
struct InvariantSample {
    float azimuth = 0.0f;
    float elevation = 0.0f;

    InvariantSample() = default;
    InvariantSample(float azimuth, float elevation) : azimuth(azimuth), elevation(elevation) {}

    InvariantSample operator-(const InvariantSample& o) const {
        return {azimuth - o.azimuth, elevation - o.elevation};
    }

    static float dot(const InvariantSample& a, const InvariantSample& b) {
        return a.azimuth * b.azimuth + a.elevation * b.elevation;
    }
};

struct StructureTensor {
    float ixix = 0.0f;
    float iyiy = 0.0f;
    float ixiy = 0.0f;
    float ixit = 0.0f;
    float iyit = 0.0f;
    float ssd = 0.0f;

    StructureTensor scaled(float s) const {
        StructureTensor t;
        t.ixix = ixix * s;
        t.iyiy = iyiy * s;
        t.ixiy = ixiy * s;
        t.ixit = ixit * s;
        t.iyit = iyit * s;
        t.ssd = ssd;
        return t;
    }

    float determinant() const {
        return ixix * iyiy - ixiy * ixiy;
    }
};

// One kernel invocation: the pixel's texture coordinate and the screen-space
// partial derivatives of that coordinate.
struct PixelInvocation {
    Vec2 coord;
    Vec2 ddx;
    Vec2 ddy;

    static PixelInvocation for_pixel(int x, int y, int width, int height) {
        PixelInvocation inv;
        inv.coord = Vec2((static_cast<float>(x) + 0.5f) / static_cast<float>(width),
                         (static_cast<float>(y) + 0.5f) / static_cast<float>(height));
        inv.ddx = Vec2(1.0f / static_cast<float>(width), 0.0f);
        inv.ddy = Vec2(0.0f, 1.0f / static_cast<float>(height));
        return inv;
    }
};

struct FlowKernelParams {
    int window_radius = 1;
    float rotation_degrees = 45.0f;
    float window_spacing = 1.0f;
    float confidence_threshold = 0.1f;
    // Average the spatial gradient of the warped reference with that of the
    // prior frame. Centers the linearization between the two frames.
    bool symmetric_gradient = false;
};

}
