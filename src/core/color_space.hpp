#pragma once

#include "core/types.hpp"
#include <cstdint>

namespace chromaflow {

struct LinearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    LinearColor() = default;
    LinearColor(float r, float g, float b) : r(r), g(g), b(b) {}
};

class ColorSpace {
public:
    // Fills the sRGB lookup tables. Call once before worker threads start.
    static void init();

    static float srgb_to_linear(uint8_t srgb);
    static uint8_t linear_to_srgb(float linear);

    // RGBA8 to planar float RGB in [0,1]; alpha is dropped. With linearize the
    // sRGB transfer curve is removed first.
    static RgbImage to_rgb_image(const FrameBuffer& frame, bool linearize = false);
    static FrameBuffer to_frame_buffer(const RgbImage& image, bool encode_srgb = false);

    // h in [0,1) turns, s and v in [0,1].
    static LinearColor hsv_to_rgb(float h, float s, float v);

private:
    static float srgb_decode_lut_[256];
    static uint8_t srgb_encode_lut_[4096];
    static bool initialized_;

    static float srgb_decode(uint8_t c);
    static uint8_t srgb_encode(float c);
};

}
