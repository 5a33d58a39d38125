#include "flow/gradient_accumulator.hpp"
#include "flow/color_invariant.hpp"
#include <algorithm>
#include <cmath>

namespace chromaflow {

SamplingWindow::SamplingWindow(int radius, float rotation_degrees, float spacing)
    : radius_(std::max(radius, 0)),
      rotation_degrees_(rotation_degrees),
      spacing_(spacing) {
    constexpr float kDegToRad = 0.017453292519943295f;
    const float c = std::cos(rotation_degrees_ * kDegToRad);
    const float s = std::sin(rotation_degrees_ * kDegToRad);

    const int side = 2 * radius_ + 1;
    offsets_.reserve(static_cast<size_t>(side) * side);
    for (int gy = -radius_; gy <= radius_; ++gy) {
        for (int gx = -radius_; gx <= radius_; ++gx) {
            const float x = static_cast<float>(gx) * spacing_;
            const float y = static_cast<float>(gy) * spacing_;
            offsets_.emplace_back(c * x - s * y, s * x + c * y);
        }
    }
}

const SamplingWindow& SamplingWindow::standard() {
    static const SamplingWindow window(1, 45.0f, 1.0f);
    return window;
}

StructureTensor accumulate_gradients(const FrameSampler& reference,
                                     const FrameSampler& prior,
                                     const PixelInvocation& invocation,
                                     const Vec2& warped_coord,
                                     const Vec2& pixel_size,
                                     const SamplingWindow& window,
                                     bool symmetric) {
    const Vec2& ddx = invocation.ddx;
    const Vec2& ddy = invocation.ddy;

    auto fetch = [&](const FrameSampler& sampler, const Vec2& coord) {
        return color_invariant(sampler.sample(coord, ddx, ddy));
    };

    const Vec2 half_x(0.5f * pixel_size.x, 0.0f);
    const Vec2 half_y(0.0f, 0.5f * pixel_size.y);

    // North is +y in texture space.
    auto derivatives = [&](const FrameSampler& sampler, const Vec2& at,
                           InvariantSample& ix, InvariantSample& iy) {
        ix = fetch(sampler, at + half_x) - fetch(sampler, at - half_x);
        iy = fetch(sampler, at + half_y) - fetch(sampler, at - half_y);
    };

    StructureTensor t;
    for (const Vec2& offset : window.offsets()) {
        const Vec2 o = offset * pixel_size;
        const Vec2 warped = warped_coord + o;
        const Vec2 unwarped = invocation.coord + o;

        const InvariantSample it = fetch(reference, warped) - fetch(prior, unwarped);

        InvariantSample ix;
        InvariantSample iy;
        derivatives(reference, warped, ix, iy);
        if (symmetric) {
            InvariantSample px;
            InvariantSample py;
            derivatives(prior, unwarped, px, py);
            ix = InvariantSample(0.5f * (ix.azimuth + px.azimuth), 0.5f * (ix.elevation + px.elevation));
            iy = InvariantSample(0.5f * (iy.azimuth + py.azimuth), 0.5f * (iy.elevation + py.elevation));
        }

        t.ixix += InvariantSample::dot(ix, ix);
        t.iyiy += InvariantSample::dot(iy, iy);
        t.ixiy += InvariantSample::dot(ix, iy);
        t.ixit += InvariantSample::dot(ix, it);
        t.iyit += InvariantSample::dot(iy, it);
        t.ssd += InvariantSample::dot(it, it);
    }
    return t;
}

}
