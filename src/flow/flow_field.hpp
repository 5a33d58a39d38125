#pragma once

#include "core/half_float.hpp"
#include "core/types.hpp"
#include "flow/flow_types.hpp"
#include <vector>

namespace chromaflow {

// Dense field of encoded flow vectors at rest between pyramid levels and
// frames, one binary16 plane per component. Because encoded flow is a
// fraction of the frame, a field can be resampled to another resolution
// without rescaling its values.
class FlowField {
public:
    FlowField() = default;
    FlowField(int w, int h);

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    EncodedVector encoded(int x, int y) const;
    void set_encoded(int x, int y, const EncodedVector& v);
    NormalizedVector normalized(int x, int y) const;

    // Clamp-to-edge bilinear fetch at a texture coordinate.
    EncodedVector sample_encoded(const Vec2& coord) const;

    FlowField resampled(int w, int h) const;
    FlowField blurred(float sigma) const;

    void clear();

    const half_bits* x_plane() const { return x_.data(); }
    const half_bits* y_plane() const { return y_.data(); }
    half_bits* x_plane() { return x_.data(); }
    half_bits* y_plane() { return y_.data(); }
    size_t plane_elements() const { return x_.size(); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<half_bits> x_;
    std::vector<half_bits> y_;

    size_t index_clamped(int x, int y) const;
};

}
