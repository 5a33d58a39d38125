#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/half_float.hpp"
#include "../src/flow/color_invariant.hpp"
#include "../src/flow/fixed_range.hpp"
#include "../src/flow/vector_normalization.hpp"
#include "../src/flow/frame_sampler.hpp"
#include "../src/flow/gradient_accumulator.hpp"
#include "../src/flow/flow_solver.hpp"
#include "../src/flow/refine_flow.hpp"

using namespace chromaflow;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static bool near(float a, float b, float eps) {
    return std::abs(a - b) <= eps;
}

static bool in_unit(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

constexpr float kPi = 3.14159265358979f;

// Two diagonal sinusoids in R and G so every pixel has gradient in both axes.
static RgbImage diagonal_texture(int w, int h, float shift_x) {
    const float k = 2.0f * kPi / 32.0f;
    RgbImage img(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const float fx = static_cast<float>(x) - shift_x;
            const float fy = static_cast<float>(y);
            img.set(x, y,
                    0.5f + 0.3f * std::sin(k * (fx + fy)),
                    0.5f + 0.3f * std::sin(k * (fx - fy)),
                    0.5f);
        }
    }
    return img;
}

TEST(invariant_degenerate_inputs) {
    const InvariantSample black = color_invariant(ColorSample(0.0f, 0.0f, 0.0f));
    assert(in_unit(black.azimuth) && in_unit(black.elevation));
    assert(near(black.azimuth, 0.5f, 1e-5f));

    const InvariantSample green = color_invariant(ColorSample(0.0f, 0.7f, 0.0f));
    assert(near(green.azimuth, 1.0f, 1e-5f));
    assert(near(green.elevation, 1.0f, 1e-5f));

    const InvariantSample blue = color_invariant(ColorSample(0.0f, 0.0f, 0.4f));
    assert(near(blue.azimuth, 0.5f, 1e-5f));
    assert(near(blue.elevation, 0.0f, 1e-5f));
}

TEST(invariant_bounded_for_extreme_inputs) {
    const float big = 1e30f;
    const std::vector<ColorSample> samples = {
        {1.0f, 1.0f, 1.0f}, {-1.0f, 0.5f, 0.2f}, {big, big, big}, {big, 1e-30f, 0.0f},
        {1e-30f, 1e-30f, 1e-30f}, {0.0f, -3.0f, 7.0f}, {5.0f, 0.0f, -5.0f},
    };
    for (const ColorSample& c : samples) {
        const InvariantSample s = color_invariant(c);
        assert(in_unit(s.azimuth));
        assert(in_unit(s.elevation));
    }
}

TEST(invariant_ignores_intensity_scale) {
    const ColorSample c(0.2f, 0.5f, 0.3f);
    const InvariantSample a = color_invariant(c);
    const InvariantSample b = color_invariant(c * 3.5f);
    assert(near(a.azimuth, b.azimuth, 1e-5f));
    assert(near(a.elevation, b.elevation, 1e-5f));
}

TEST(half_conversion) {
    assert(float_to_half(0.0f) == 0);
    assert(float_to_half(1.0f) == 0x3C00);
    assert(float_to_half(-2.0f) == 0xC000);
    assert(float_to_half(65504.0f) == HALF_MAX_FINITE_BITS);
    assert(float_to_half(1e9f) == HALF_MAX_FINITE_BITS);
    assert(float_to_half(-1e9f) == (0x8000 | HALF_MAX_FINITE_BITS));
    assert(float_to_half(std::numeric_limits<float>::infinity()) == HALF_MAX_FINITE_BITS);
    assert(float_to_half(std::numeric_limits<float>::quiet_NaN()) == 0);
    assert(half_to_float(0x3C00) == 1.0f);
    assert(half_to_float(HALF_MAX_FINITE_BITS) == 65504.0f);
    assert(half_to_float(0x0001) > 0.0f);

    for (float v : {0.1f, -3.3f, 1000.25f, 12345.0f, 6.1e-5f}) {
        const float q = quantize_to_half(v);
        assert(std::abs(q - v) <= std::abs(v) * (1.0f / 2048.0f) + 1e-7f);
    }
}

TEST(fixed_range_constant) {
    assert(FIXED_RANGE_MAX == 65504.0f);
    const double single_max = max_finite_magnitude(SINGLE_FORMAT);
    assert(std::abs(single_max - 3.4028234663852886e38) / 3.4028234663852886e38 < 1e-12);
}

TEST(fixed_range_codec) {
    const NormalizedVector n(0.25f, -0.75f);
    const NormalizedVector back = decode_to_normalized(encode_from_normalized(n));
    assert(near(back.x, n.x, 1e-6f));
    assert(near(back.y, n.y, 1e-6f));

    const NormalizedVector clamped = decode_to_normalized(EncodedVector(1e6f, -1e6f));
    assert(clamped.x == 1.0f);
    assert(clamped.y == -1.0f);

    // Storage precision: one binary16 step.
    const float stored = quantize_to_half(encode_from_normalized(NormalizedVector(0.123f, 0.0f)).x);
    assert(near(decode_to_normalized(EncodedVector(stored, 0.0f)).x, 0.123f, 0.123f / 1024.0f));
}

TEST(vector_normalization) {
    const Vec2 pixel_size(1.0f / 640.0f, 1.0f / 480.0f);
    const PixelVector p(3.0f, -2.0f);
    const NormalizedVector n = to_normalized(p, pixel_size);
    assert(near(n.x, 3.0f / 640.0f, 1e-7f));
    const PixelVector back = to_pixel(n, pixel_size);
    assert(near(back.x, 3.0f, 1e-4f));
    assert(near(back.y, -2.0f, 1e-4f));

    const NormalizedVector sign_free = to_normalized(p, Vec2(-pixel_size.x, -pixel_size.y));
    assert(sign_free == n);

    const NormalizedVector big = to_normalized(PixelVector(5000.0f, -5000.0f), pixel_size);
    assert(big.x == 1.0f && big.y == -1.0f);
}

TEST(sampling_window_layout) {
    const SamplingWindow& w = SamplingWindow::standard();
    assert(w.offsets().size() == 9);
    assert(near(w.offsets()[4].x, 0.0f, 1e-6f) && near(w.offsets()[4].y, 0.0f, 1e-6f));
    // Grid offset (1, 0) rotated by 45 degrees.
    assert(near(w.offsets()[5].x, 0.70710678f, 1e-5f));
    assert(near(w.offsets()[5].y, 0.70710678f, 1e-5f));

    const SamplingWindow wide(2, 0.0f, 1.5f);
    assert(wide.offsets().size() == 25);
    assert(near(wide.offsets()[0].x, -3.0f, 1e-6f));
    assert(near(wide.offsets()[0].y, -3.0f, 1e-6f));
}

TEST(solver_degenerate_tensor) {
    const StructureTensor zero;
    const PixelVector f = solve_flow(zero);
    assert(f.x == 0.0f && f.y == 0.0f);
    assert(confidence_mask(zero) == 0.0f);

    StructureTensor indefinite;
    indefinite.ixix = 1.0f;
    indefinite.iyiy = 1.0f;
    indefinite.ixiy = 2.0f;
    indefinite.ixit = 1.0f;
    indefinite.ssd = 10.0f;
    const PixelVector g = solve_flow(indefinite);
    assert(g.x == 0.0f && g.y == 0.0f);

    StructureTensor tiny;
    tiny.ixix = 1e-30f;
    tiny.iyiy = 1e-30f;
    tiny.ixit = 1.0f;
    tiny.ssd = 1.0f;
    const PixelVector h = solve_flow(tiny);
    assert(std::isfinite(h.x) && std::isfinite(h.y));
}

TEST(solver_closed_form) {
    StructureTensor t;
    t.ixix = 2.0f;
    t.iyiy = 1.0f;
    t.ixiy = 0.0f;
    t.ixit = -2.0f;
    t.iyit = -3.0f;
    t.ssd = 10.0f;
    const PixelVector f = solve_flow(t);
    assert(near(f.x, 1.0f, 1e-6f));
    assert(near(f.y, 3.0f, 1e-6f));
}

TEST(solver_confidence_gate) {
    StructureTensor t;
    t.ixix = 2.0f;
    t.iyiy = 1.0f;
    t.ixit = -2.0f;
    t.iyit = -3.0f;
    t.ssd = 0.3f;  // ratio exactly 0.1
    assert(confidence_mask(t) == 0.0f);
    const PixelVector f = solve_flow(t);
    assert(f.x == 0.0f && f.y == 0.0f);

    t.ssd = 0.31f;
    assert(confidence_mask(t) == 1.0f);
    assert(confidence_mask(t, 0.5f) == 0.0f);
}

TEST(sampler_bilinear_and_lod) {
    RgbImage img(4, 2);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 4; ++x) {
            img.set(x, y, static_cast<float>(x), static_cast<float>(y), 0.5f);
        }
    }
    const ColorSample center = sample_bilinear(img, Vec2(1.5f / 4.0f, 0.5f / 2.0f));
    assert(near(center.r, 1.0f, 1e-6f) && near(center.g, 0.0f, 1e-6f));

    const ColorSample between = sample_bilinear(img, Vec2(2.0f / 4.0f, 1.0f / 2.0f));
    assert(near(between.r, 1.5f, 1e-6f) && near(between.g, 0.5f, 1e-6f));

    const ColorSample outside = sample_bilinear(img, Vec2(-3.0f, 5.0f));
    assert(near(outside.r, 0.0f, 1e-6f) && near(outside.g, 1.0f, 1e-6f));

    RgbImage half(2, 1);
    half.set(0, 0, 0.5f, 0.5f, 0.5f);
    half.set(1, 0, 2.5f, 0.5f, 0.5f);
    const MipmappedFrameSampler mip(std::vector<const RgbImage*>{&img, nullptr, &half});
    assert(mip.level_count() == 2);
    assert(mip.level_of_detail(Vec2(0.25f, 0.0f), Vec2(0.0f, 0.5f)) == 0.0f);
    assert(near(mip.level_of_detail(Vec2(0.5f, 0.0f), Vec2(0.0f, 1.0f)), 1.0f, 1e-5f));
    assert(near(mip.level_of_detail(Vec2(4.0f, 0.0f), Vec2(0.0f, 1.0f)), 1.0f, 1e-5f));

    const ColorSample coarse = mip.sample(Vec2(0.25f, 0.5f), Vec2(0.5f, 0.0f), Vec2(0.0f, 1.0f));
    assert(near(coarse.r, 0.5f, 1e-5f));
}

TEST(warp_and_pixel_size) {
    const Vec2 unwarped = warp_coordinate(Vec2(0.3f, 0.7f), EncodedVector());
    assert(near(unwarped.x, 0.3f, 1e-6f) && near(unwarped.y, 0.7f, 1e-6f));

    const Vec2 shifted = warp_coordinate(Vec2(0.3f, 0.7f),
                                         encode_from_normalized(NormalizedVector(0.1f, -0.2f)));
    assert(near(shifted.x, 0.4f, 1e-5f) && near(shifted.y, 0.5f, 1e-5f));

    const Vec2 clamped = warp_coordinate(Vec2(0.9f, 0.1f),
                                         encode_from_normalized(NormalizedVector(0.5f, -0.5f)));
    assert(clamped.x < 1.0f && clamped.y == 0.0f);
    assert(clamped.x == std::nextafter(1.0f, 0.0f));

    const Vec2 size = pixel_size_from_derivatives(Vec2(-0.01f, 0.0f), Vec2(0.0f, 0.02f));
    assert(near(size.x, 0.01f, 1e-7f) && near(size.y, 0.02f, 1e-7f));
}

TEST(refine_identical_frames_is_zero) {
    const RgbImage frame = diagonal_texture(32, 32, 0.0f);
    const MipmappedFrameSampler sampler(frame);
    for (int y = 0; y < 32; y += 5) {
        for (int x = 0; x < 32; x += 3) {
            const EncodedVector out =
                refine_flow(PixelInvocation::for_pixel(x, y, 32, 32), EncodedVector(), sampler, sampler);
            const NormalizedVector n = decode_to_normalized(out);
            assert(n.x == 0.0f && n.y == 0.0f);
        }
    }
}

TEST(refine_flat_frame_keeps_incoming) {
    RgbImage flat(16, 16);
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) flat.set(x, y, 0.2f, 0.6f, 0.4f);
    }
    const MipmappedFrameSampler sampler(flat);
    const EncodedVector incoming = encode_from_normalized(NormalizedVector(0.05f, -0.02f));
    const EncodedVector out =
        refine_flow(PixelInvocation::for_pixel(7, 7, 16, 16), incoming, sampler, sampler);
    assert(near(out.x, incoming.x, 1e-2f));
    assert(near(out.y, incoming.y, 1e-2f));
}

TEST(refine_recovers_one_pixel_shift) {
    const int w = 64;
    const int h = 64;
    const RgbImage previous = diagonal_texture(w, h, 0.0f);
    const RgbImage current = diagonal_texture(w, h, 1.0f);
    const MipmappedFrameSampler prev_sampler(previous);
    const MipmappedFrameSampler curr_sampler(current);

    // Both sinusoids are at their steepest here.
    for (int p : {8, 24, 40}) {
        const PixelInvocation inv = PixelInvocation::for_pixel(p, p, w, h);
        const EncodedVector out = refine_flow(inv, EncodedVector(), curr_sampler, prev_sampler);
        const PixelVector px = to_pixel(decode_to_normalized(out), pixel_size_from_derivatives(inv.ddx, inv.ddy));
        assert(near(px.x, 1.0f, 0.1f));
        assert(near(px.y, 0.0f, 0.1f));
    }
}

TEST(symmetric_gradient_matches_on_identical_frames) {
    const RgbImage frame = diagonal_texture(32, 32, 0.0f);
    const MipmappedFrameSampler sampler(frame);
    const PixelInvocation inv = PixelInvocation::for_pixel(11, 13, 32, 32);
    const Vec2 size = pixel_size_from_derivatives(inv.ddx, inv.ddy);

    const StructureTensor plain =
        accumulate_gradients(sampler, sampler, inv, inv.coord, size, SamplingWindow::standard());
    const StructureTensor mixed =
        accumulate_gradients(sampler, sampler, inv, inv.coord, size, SamplingWindow::standard(), true);
    assert(plain.ixix > 0.0f && plain.iyiy > 0.0f);
    assert(near(mixed.ixix, plain.ixix, 1e-6f));
    assert(near(mixed.iyiy, plain.iyiy, 1e-6f));
    assert(near(mixed.ixiy, plain.ixiy, 1e-6f));
    assert(mixed.ixit == 0.0f && mixed.iyit == 0.0f && mixed.ssd == 0.0f);
}

TEST(refine_output_always_bounded) {
    const RgbImage previous = diagonal_texture(16, 16, 0.0f);
    const RgbImage current = diagonal_texture(16, 16, 5.0f);
    const MipmappedFrameSampler prev_sampler(previous);
    const MipmappedFrameSampler curr_sampler(current);

    const FlowKernelParams loose{1, 45.0f, 1.0f, 0.0f};
    const FlowKernel kernel(loose);
    for (float seed : {0.0f, 65504.0f, -65504.0f, 1e7f}) {
        for (int y = 0; y < 16; ++y) {
            for (int x = 0; x < 16; ++x) {
                const EncodedVector out = kernel.refine(PixelInvocation::for_pixel(x, y, 16, 16),
                                                        EncodedVector(seed, -seed), curr_sampler, prev_sampler);
                assert(std::isfinite(out.x) && std::isfinite(out.y));
                assert(std::abs(out.x) <= FIXED_RANGE_MAX && std::abs(out.y) <= FIXED_RANGE_MAX);
            }
        }
    }
}

int main() {
    std::cout << "=== Flow Kernel Test Suite ===\n\n";

    std::cout << "--- Color Invariant ---\n";
    RUN_TEST(invariant_degenerate_inputs);
    RUN_TEST(invariant_bounded_for_extreme_inputs);
    RUN_TEST(invariant_ignores_intensity_scale);

    std::cout << "\n--- Storage and Normalization ---\n";
    RUN_TEST(half_conversion);
    RUN_TEST(fixed_range_constant);
    RUN_TEST(fixed_range_codec);
    RUN_TEST(vector_normalization);

    std::cout << "\n--- Window and Solver ---\n";
    RUN_TEST(sampling_window_layout);
    RUN_TEST(solver_degenerate_tensor);
    RUN_TEST(solver_closed_form);
    RUN_TEST(solver_confidence_gate);

    std::cout << "\n--- Sampling and Refinement ---\n";
    RUN_TEST(sampler_bilinear_and_lod);
    RUN_TEST(warp_and_pixel_size);
    RUN_TEST(refine_identical_frames_is_zero);
    RUN_TEST(refine_flat_frame_keeps_incoming);
    RUN_TEST(refine_recovers_one_pixel_shift);
    RUN_TEST(symmetric_gradient_matches_on_identical_frames);
    RUN_TEST(refine_output_always_bounded);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    return failures == 0 ? 0 : 1;
}
