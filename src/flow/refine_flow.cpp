#include "flow/refine_flow.hpp"
#include "flow/fixed_range.hpp"
#include "flow/flow_solver.hpp"
#include "flow/vector_normalization.hpp"
#include <cmath>

namespace chromaflow {

Vec2 warp_coordinate(const Vec2& coord, const EncodedVector& incoming) {
    const EncodedVector centered = encode_from_normalized(coord - Vec2(0.5f, 0.5f));
    const NormalizedVector shifted = decode_to_normalized(centered + incoming);
    // Texture coordinates live in [0, 1).
    return (shifted + Vec2(0.5f, 0.5f)).clamped(0.0f, std::nextafter(1.0f, 0.0f));
}

Vec2 pixel_size_from_derivatives(const Vec2& ddx, const Vec2& ddy) {
    return ddx.abs() + ddy.abs();
}

FlowKernel::FlowKernel(const FlowKernelParams& params)
    : params_(params),
      window_(params.window_radius, params.rotation_degrees, params.window_spacing) {}

EncodedVector FlowKernel::refine(const PixelInvocation& invocation,
                                 const EncodedVector& incoming,
                                 const FrameSampler& current,
                                 const FrameSampler& previous) const {
    const NormalizedVector base = decode_to_normalized(incoming);
    const Vec2 warped = warp_coordinate(invocation.coord, incoming);
    const Vec2 pixel_size = pixel_size_from_derivatives(invocation.ddx, invocation.ddy);

    const StructureTensor tensor =
        accumulate_gradients(current, previous, invocation, warped, pixel_size, window_,
                             params_.symmetric_gradient);
    const PixelVector correction = solve_flow(tensor, params_.confidence_threshold);

    const NormalizedVector refined = (base + to_normalized(correction, pixel_size)).clamped(-1.0f, 1.0f);
    return encode_from_normalized(refined);
}

EncodedVector refine_flow(const PixelInvocation& invocation,
                          const EncodedVector& incoming,
                          const FrameSampler& current,
                          const FrameSampler& previous) {
    static const FlowKernel kernel;
    return kernel.refine(invocation, incoming, current, previous);
}

}
