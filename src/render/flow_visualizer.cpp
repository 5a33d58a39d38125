#include "render/flow_visualizer.hpp"
#include "core/color_space.hpp"
#include "flow/vector_normalization.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace chromaflow {

namespace {

constexpr float TWO_PI = 6.28318530717958647692f;

}  // namespace

FrameBuffer FlowVisualizer::render(const FlowField& field) const {
    return render(field, FrameBuffer());
}

FrameBuffer FlowVisualizer::render(const FlowField& field, const FrameBuffer& background) const {
    const int w = field.width();
    const int h = field.height();
    FrameBuffer out(w, h, Color(0, 0, 0));
    if (field.empty()) return out;

    const Vec2 pixel_size(1.0f / static_cast<float>(w), 1.0f / static_cast<float>(h));
    std::vector<Vec2> motion(static_cast<size_t>(w) * h);
    float max_mag = 0.0f;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const Vec2 p = to_pixel(field.normalized(x, y), pixel_size);
            motion[static_cast<size_t>(y) * w + x] = p;
            max_mag = std::max(max_mag, p.length());
        }
    }

    const float scale = config_.max_motion > 0.0f ? config_.max_motion : max_mag;
    last_scale_ = scale;
    const bool blend = config_.background_blend > 0.0f && background.width() == w &&
                       background.height() == h;
    const float bg = std::clamp(config_.background_blend, 0.0f, 1.0f);

#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const Vec2& p = motion[static_cast<size_t>(y) * w + x];
            const float mag = p.length();
            float hue = std::atan2(p.y, p.x) / TWO_PI;
            if (hue < 0.0f) hue += 1.0f;
            const float value = scale > 0.0f ? std::min(mag / scale, 1.0f) : 0.0f;
            LinearColor c = ColorSpace::hsv_to_rgb(hue, 1.0f, value);

            if (blend) {
                const Color under = background.get_pixel(x, y);
                const float luma = (0.299f * under.r + 0.587f * under.g + 0.114f * under.b) / 255.0f;
                const float base = luma * bg * (1.0f - value);
                c = LinearColor(c.r + base, c.g + base, c.b + base);
            }
            out.set_pixel(x, y, Color::from_float(c.r, c.g, c.b));
        }
    }
    return out;
}

}
