#include "flow/flow_field.hpp"
#include "core/pyramid.hpp"
#include "flow/fixed_range.hpp"
#include <algorithm>

namespace chromaflow {

FlowField::FlowField(int w, int h)
    : width_(std::max(w, 0)),
      height_(std::max(h, 0)),
      x_(static_cast<size_t>(width_) * height_, 0),
      y_(static_cast<size_t>(width_) * height_, 0) {}

size_t FlowField::index_clamped(int x, int y) const {
    x = std::clamp(x, 0, width_ - 1);
    y = std::clamp(y, 0, height_ - 1);
    return static_cast<size_t>(y) * width_ + x;
}

EncodedVector FlowField::encoded(int x, int y) const {
    if (empty()) return EncodedVector();
    const size_t idx = index_clamped(x, y);
    return EncodedVector(half_to_float(x_[idx]), half_to_float(y_[idx]));
}

void FlowField::set_encoded(int x, int y, const EncodedVector& v) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
    const size_t idx = static_cast<size_t>(y) * width_ + x;
    x_[idx] = float_to_half(v.x);
    y_[idx] = float_to_half(v.y);
}

NormalizedVector FlowField::normalized(int x, int y) const {
    return decode_to_normalized(encoded(x, y));
}

EncodedVector FlowField::sample_encoded(const Vec2& coord) const {
    if (empty()) return EncodedVector();

    const float fx = std::clamp(coord.x * static_cast<float>(width_) - 0.5f, 0.0f, static_cast<float>(width_ - 1));
    const float fy = std::clamp(coord.y * static_cast<float>(height_) - 0.5f, 0.0f, static_cast<float>(height_ - 1));
    const int x0 = static_cast<int>(fx);
    const int y0 = static_cast<int>(fy);
    const float tx = fx - static_cast<float>(x0);
    const float ty = fy - static_cast<float>(y0);

    const EncodedVector v00 = encoded(x0, y0);
    const EncodedVector v10 = encoded(x0 + 1, y0);
    const EncodedVector v01 = encoded(x0, y0 + 1);
    const EncodedVector v11 = encoded(x0 + 1, y0 + 1);

    const EncodedVector top = v00 + (v10 - v00) * tx;
    const EncodedVector bottom = v01 + (v11 - v01) * tx;
    return top + (bottom - top) * ty;
}

FlowField FlowField::resampled(int w, int h) const {
    FlowField out(w, h);
    if (empty()) return out;
    if (w == width_ && h == height_) return *this;

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const Vec2 coord((static_cast<float>(x) + 0.5f) / static_cast<float>(w),
                             (static_cast<float>(y) + 0.5f) / static_cast<float>(h));
            out.set_encoded(x, y, sample_encoded(coord));
        }
    }
    return out;
}

FlowField FlowField::blurred(float sigma) const {
    if (sigma <= 0.0f || empty()) return *this;

    FloatImage fx(width_, height_);
    FloatImage fy(width_, height_);
    for (size_t i = 0; i < x_.size(); ++i) {
        fx.data()[i] = half_to_float(x_[i]);
        fy.data()[i] = half_to_float(y_[i]);
    }
    fx = gaussian_blur(fx, sigma);
    fy = gaussian_blur(fy, sigma);

    FlowField out(width_, height_);
    for (size_t i = 0; i < x_.size(); ++i) {
        out.x_[i] = float_to_half(fx.data()[i]);
        out.y_[i] = float_to_half(fy.data()[i]);
    }
    return out;
}

void FlowField::clear() {
    std::fill(x_.begin(), x_.end(), half_bits{0});
    std::fill(y_.begin(), y_.end(), half_bits{0});
}

}
