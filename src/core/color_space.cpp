#include "core/color_space.hpp"
#include <cmath>
#include <algorithm>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace chromaflow {

float ColorSpace::srgb_decode_lut_[256];
uint8_t ColorSpace::srgb_encode_lut_[4096];
bool ColorSpace::initialized_ = false;

void ColorSpace::init() {
    if (initialized_) return;

    for (int i = 0; i < 256; ++i) {
        srgb_decode_lut_[i] = srgb_decode(static_cast<uint8_t>(i));
    }
    for (int i = 0; i < 4096; ++i) {
        srgb_encode_lut_[i] = srgb_encode(i / 4095.0f);
    }

    initialized_ = true;
}

float ColorSpace::srgb_decode(uint8_t c) {
    float cv = c / 255.0f;
    if (cv <= 0.04045f) {
        return cv / 12.92f;
    }
    return std::pow((cv + 0.055f) / 1.055f, 2.4f);
}

uint8_t ColorSpace::srgb_encode(float c) {
    c = std::clamp(c, 0.0f, 1.0f);
    float result;
    if (c <= 0.0031308f) {
        result = 12.92f * c;
    } else {
        result = 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
    }
    return static_cast<uint8_t>(std::clamp(std::round(result * 255.0f), 0.0f, 255.0f));
}

float ColorSpace::srgb_to_linear(uint8_t srgb) {
    if (initialized_) {
        return srgb_decode_lut_[srgb];
    }
    return srgb_decode(srgb);
}

uint8_t ColorSpace::linear_to_srgb(float linear) {
    if (initialized_) {
        int idx = static_cast<int>(std::clamp(linear, 0.0f, 1.0f) * 4095.0f + 0.5f);
        return srgb_encode_lut_[idx];
    }
    return srgb_encode(linear);
}

RgbImage ColorSpace::to_rgb_image(const FrameBuffer& frame, bool linearize) {
    const int w = frame.width();
    const int h = frame.height();
    RgbImage out(w, h);
    const uint8_t* src = frame.data();

#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const size_t idx = (static_cast<size_t>(y) * w + x) * 4;
            if (linearize) {
                out.set(x, y, srgb_to_linear(src[idx]), srgb_to_linear(src[idx + 1]),
                        srgb_to_linear(src[idx + 2]));
            } else {
                out.set(x, y, src[idx] / 255.0f, src[idx + 1] / 255.0f, src[idx + 2] / 255.0f);
            }
        }
    }
    return out;
}

FrameBuffer ColorSpace::to_frame_buffer(const RgbImage& image, bool encode_srgb) {
    const int w = image.width();
    const int h = image.height();
    FrameBuffer out(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const float r = image.r.get(x, y);
            const float g = image.g.get(x, y);
            const float b = image.b.get(x, y);
            if (encode_srgb) {
                out.set_pixel(x, y, Color(linear_to_srgb(r), linear_to_srgb(g), linear_to_srgb(b)));
            } else {
                out.set_pixel(x, y, Color::from_float(r, g, b));
            }
        }
    }
    return out;
}

LinearColor ColorSpace::hsv_to_rgb(float h, float s, float v) {
    h = h - std::floor(h);
    s = std::clamp(s, 0.0f, 1.0f);
    v = std::clamp(v, 0.0f, 1.0f);

    const float h6 = h * 6.0f;
    const int sector = static_cast<int>(h6) % 6;
    const float f = h6 - std::floor(h6);
    const float p = v * (1.0f - s);
    const float q = v * (1.0f - s * f);
    const float t = v * (1.0f - s * (1.0f - f));

    switch (sector) {
        case 0: return {v, t, p};
        case 1: return {q, v, p};
        case 2: return {p, v, t};
        case 3: return {p, q, v};
        case 4: return {t, p, v};
        default: return {v, p, q};
    }
}

}
