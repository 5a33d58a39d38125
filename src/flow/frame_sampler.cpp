#include "flow/frame_sampler.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace chromaflow {

ColorSample sample_bilinear(const RgbImage& image, const Vec2& coord) {
    const int w = image.width();
    const int h = image.height();
    if (w <= 0 || h <= 0) {
        return ColorSample();
    }

    const float fx = std::clamp(coord.x * static_cast<float>(w) - 0.5f, 0.0f, static_cast<float>(w - 1));
    const float fy = std::clamp(coord.y * static_cast<float>(h) - 0.5f, 0.0f, static_cast<float>(h - 1));

    const int x0 = static_cast<int>(fx);
    const int y0 = static_cast<int>(fy);
    const int x1 = std::min(x0 + 1, w - 1);
    const int y1 = std::min(y0 + 1, h - 1);
    const float tx = fx - static_cast<float>(x0);
    const float ty = fy - static_cast<float>(y0);

    auto lerp2 = [&](const FloatImage& c) {
        const float top = c.get(x0, y0) + (c.get(x1, y0) - c.get(x0, y0)) * tx;
        const float bottom = c.get(x0, y1) + (c.get(x1, y1) - c.get(x0, y1)) * tx;
        return top + (bottom - top) * ty;
    };

    return ColorSample(lerp2(image.r), lerp2(image.g), lerp2(image.b));
}

MipmappedFrameSampler::MipmappedFrameSampler(const RgbImage& image) {
    levels_.push_back(&image);
}

MipmappedFrameSampler::MipmappedFrameSampler(std::vector<const RgbImage*> levels)
    : levels_(std::move(levels)) {
    levels_.erase(std::remove(levels_.begin(), levels_.end(), nullptr), levels_.end());
}

float MipmappedFrameSampler::level_of_detail(const Vec2& ddx, const Vec2& ddy) const {
    if (levels_.empty()) {
        return 0.0f;
    }
    const Vec2 texels(static_cast<float>(levels_[0]->width()), static_cast<float>(levels_[0]->height()));
    const float footprint = std::max((ddx * texels).length(), (ddy * texels).length());
    // One texel per pixel (up to float rounding of 1/size) samples the finest level.
    if (!(footprint > 1.0001f)) {
        return 0.0f;
    }
    const float max_lod = static_cast<float>(levels_.size() - 1);
    return std::min(std::log2(footprint), max_lod);
}

ColorSample MipmappedFrameSampler::sample(const Vec2& coord, const Vec2& ddx, const Vec2& ddy) const {
    if (levels_.empty()) {
        return ColorSample();
    }

    const float lod = level_of_detail(ddx, ddy);
    const int lo = static_cast<int>(lod);
    const float t = lod - static_cast<float>(lo);

    ColorSample c = sample_bilinear(*levels_[lo], coord);
    if (t > 0.0f && lo + 1 < level_count()) {
        const ColorSample c1 = sample_bilinear(*levels_[lo + 1], coord);
        c = c * (1.0f - t) + c1 * t;
    }
    return c;
}

}
