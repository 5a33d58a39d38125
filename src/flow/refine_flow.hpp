#pragma once

#include "flow/flow_types.hpp"
#include "flow/frame_sampler.hpp"
#include "flow/gradient_accumulator.hpp"

namespace chromaflow {

// Texture coordinate displaced by the incoming flow. The shift is applied in
// fixed-range units, the precision the flow is stored at, and the result is
// clamped to [0,1].
Vec2 warp_coordinate(const Vec2& coord, const EncodedVector& incoming);

// Per-axis pixel footprint |ddx| + |ddy| in texture units.
Vec2 pixel_size_from_derivatives(const Vec2& ddx, const Vec2& ddy);

// One LK refinement step for a single pixel at one pyramid level. Pure and
// total: any finite input yields a finite encoded vector whose normalized form
// lies in [-1,1].
class FlowKernel {
public:
    FlowKernel() : FlowKernel(FlowKernelParams{}) {}
    explicit FlowKernel(const FlowKernelParams& params);

    EncodedVector refine(const PixelInvocation& invocation,
                         const EncodedVector& incoming,
                         const FrameSampler& current,
                         const FrameSampler& previous) const;

    const FlowKernelParams& params() const { return params_; }
    const SamplingWindow& window() const { return window_; }

private:
    FlowKernelParams params_;
    SamplingWindow window_;
};

// refine() with the default 3x3 / 45 degree / 0.1 kernel.
EncodedVector refine_flow(const PixelInvocation& invocation,
                          const EncodedVector& incoming,
                          const FrameSampler& current,
                          const FrameSampler& previous);

}
