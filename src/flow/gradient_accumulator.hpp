#pragma once

#include "flow/flow_types.hpp"
#include "flow/frame_sampler.hpp"
#include <vector>

namespace chromaflow {

// Offsets of a (2r+1)x(2r+1) grid rotated about its center, in pixel units.
// Rotating the grid keeps the taps off the axis-aligned lattice of the
// gradient stencil. Immutable once built.
class SamplingWindow {
public:
    SamplingWindow() : SamplingWindow(1, 45.0f, 1.0f) {}
    SamplingWindow(int radius, float rotation_degrees, float spacing);

    const std::vector<Vec2>& offsets() const { return offsets_; }
    int radius() const { return radius_; }
    float rotation_degrees() const { return rotation_degrees_; }
    float spacing() const { return spacing_; }

    // 3x3 window rotated by 45 degrees.
    static const SamplingWindow& standard();

private:
    int radius_ = 1;
    float rotation_degrees_ = 45.0f;
    float spacing_ = 1.0f;
    std::vector<Vec2> offsets_;
};

// Accumulates the LK normal equations over the window. The temporal term
// compares the reference frame at the warped position against the prior frame
// at the unwarped position; spatial gradients come from the reference frame
// only, using taps half a pixel to either side so Ix/Iy are per-pixel
// derivatives. With symmetric set, each derivative is the mean of the
// reference taps and the same taps on the prior frame.
StructureTensor accumulate_gradients(const FrameSampler& reference,
                                     const FrameSampler& prior,
                                     const PixelInvocation& invocation,
                                     const Vec2& warped_coord,
                                     const Vec2& pixel_size,
                                     const SamplingWindow& window,
                                     bool symmetric = false);

}
