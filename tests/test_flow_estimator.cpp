#include <iostream>
#include <cassert>
#include <cmath>
#include <cstring>
#include <algorithm>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/pyramid.hpp"
#include "../src/flow/fixed_range.hpp"
#include "../src/flow/flow_field.hpp"
#include "../src/flow/flow_estimator.hpp"

#ifdef HAS_OPENMP
#include <omp.h>
#endif

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

constexpr float kPi = 3.14159265358979f;

static RgbImage diagonal_texture(int w, int h, float shift_x, float shift_y = 0.0f, float period = 32.0f) {
    const float k = 2.0f * kPi / period;
    RgbImage img(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const float fx = static_cast<float>(x) - shift_x;
            const float fy = static_cast<float>(y) - shift_y;
            img.set(x, y,
                    0.5f + 0.3f * std::sin(k * (fx + fy)),
                    0.5f + 0.3f * std::sin(k * (fx - fy)),
                    0.5f);
        }
    }
    return img;
}

static FlowEstimator::Config single_level() {
    FlowEstimator::Config cfg;
    cfg.pyramid_levels = 1;
    cfg.frame_blur_sigma = 0.0f;
    cfg.flow_blur_sigma = 0.0f;
    return cfg;
}

static float median(std::vector<float> values) {
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

struct InteriorStats {
    float median_x = 0.0f;
    float median_y = 0.0f;
    float within = 0.0f;  // fraction of pixels within tolerance of the target
};

static InteriorStats interior_stats(const FlowEstimator& est, int margin, float tx, float ty, float tol) {
    std::vector<float> xs;
    std::vector<float> ys;
    int good = 0;
    for (int y = margin; y < est.height() - margin; ++y) {
        for (int x = margin; x < est.width() - margin; ++x) {
            const PixelVector p = est.pixel_flow(x, y);
            xs.push_back(p.x);
            ys.push_back(p.y);
            if (near(p.x, tx, tol) && near(p.y, ty, tol)) ++good;
        }
    }
    InteriorStats s;
    s.median_x = median(xs);
    s.median_y = median(ys);
    s.within = static_cast<float>(good) / static_cast<float>(xs.size());
    return s;
}

TEST(pyramid_levels_respect_min_size) {
    const RgbImage img = diagonal_texture(64, 48, 0.0f);
    ImagePyramid pyr;
    ImagePyramid::Config pc;
    pc.levels = 8;
    pc.min_level_size = 8;
    pyr.build(img, pc);
    assert(pyr.level_count() == 3);
    assert(pyr.level(1).width() == 32 && pyr.level(1).height() == 24);
    assert(pyr.level(2).width() == 16 && pyr.level(2).height() == 12);
    assert(pyr.chain_from(1).size() == 2);

    pc.levels = 1;
    pyr.build(img, pc);
    assert(pyr.level_count() == 1);

    pyr.build(RgbImage(), pc);
    assert(pyr.empty());
}

TEST(blur_preserves_constant) {
    FloatImage flat(9, 5, 0.25f);
    const FloatImage blurred = gaussian_blur(flat, 2.0f);
    for (int y = 0; y < 5; ++y) {
        for (int x = 0; x < 9; ++x) {
            assert(near(blurred.get(x, y), 0.25f, 1e-6f));
        }
    }
    const FloatImage small = downsample_half(flat);
    assert(small.width() == 4 && small.height() == 2);
    assert(near(small.get(3, 1), 0.25f, 1e-6f));
}

TEST(flow_field_access) {
    FlowField field(4, 3);
    assert(!field.empty());
    assert(field.plane_elements() == 12);
    assert(field.encoded(2, 1).x == 0.0f);

    field.set_encoded(2, 1, EncodedVector(100.0f, -50.0f));
    assert(field.encoded(2, 1).x == 100.0f);
    assert(field.encoded(2, 1).y == -50.0f);
    // Out-of-range reads clamp to the edge; writes are dropped.
    field.set_encoded(3, 2, EncodedVector(8.0f, 8.0f));
    assert(field.encoded(10, 10).x == 8.0f);
    field.set_encoded(-1, 0, EncodedVector(1.0f, 1.0f));
    assert(field.encoded(0, 0).x == 0.0f);

    const NormalizedVector n = field.normalized(2, 1);
    assert(near(n.x, 100.0f / FIXED_RANGE_MAX, 1e-6f));

    field.clear();
    assert(!field.empty());
    assert(field.encoded(2, 1).x == 0.0f && field.encoded(3, 2).y == 0.0f);
}

TEST(flow_field_resample_and_blur) {
    FlowField field(8, 8);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) field.set_encoded(x, y, EncodedVector(512.0f, -256.0f));
    }
    const FlowField up = field.resampled(16, 12);
    assert(up.width() == 16 && up.height() == 12);
    assert(near(up.encoded(7, 5).x, 512.0f, 0.5f));
    assert(near(up.encoded(15, 11).y, -256.0f, 0.5f));

    const FlowField soft = field.blurred(1.5f);
    assert(near(soft.encoded(0, 0).x, 512.0f, 0.5f));
    assert(near(soft.encoded(4, 4).y, -256.0f, 0.5f));

    const FlowField same = field.blurred(0.0f);
    assert(std::memcmp(same.x_plane(), field.x_plane(), field.plane_elements() * sizeof(half_bits)) == 0);
}

TEST(identical_frames_give_zero_flow) {
    FlowEstimator est;
    const RgbImage frame = diagonal_texture(48, 40, 0.0f);
    const Result r = est.compute(frame, frame);
    assert(r.success());
    assert(est.width() == 48 && est.height() == 40);
    for (int y = 0; y < est.height(); ++y) {
        for (int x = 0; x < est.width(); ++x) {
            const NormalizedVector n = est.normalized_flow(x, y);
            assert(n.x == 0.0f && n.y == 0.0f);
        }
    }
}

// One linearization step with the reference-frame gradient is exact only
// where the texture is close to linear over the shift, so use a long period.
TEST(single_level_recovers_one_pixel_shift) {
    FlowEstimator est(single_level());
    const RgbImage previous = diagonal_texture(64, 64, 0.0f, 0.0f, 64.0f);
    const RgbImage current = diagonal_texture(64, 64, 1.0f, 0.0f, 64.0f);
    assert(est.compute(previous, current).success());
    assert(est.levels_used() == 1);

    const InteriorStats s = interior_stats(est, 4, 1.0f, 0.0f, 0.1f);
    assert(near(s.median_x, 1.0f, 0.1f));
    assert(near(s.median_y, 0.0f, 0.1f));
    assert(s.within > 0.75f);
}

TEST(symmetric_gradient_recovers_shift_per_pixel) {
    FlowEstimator::Config cfg = single_level();
    cfg.kernel.symmetric_gradient = true;
    FlowEstimator est(cfg);
    const RgbImage previous = diagonal_texture(64, 64, 0.0f);
    const RgbImage current = diagonal_texture(64, 64, 1.0f);
    assert(est.compute(previous, current).success());

    const InteriorStats s = interior_stats(est, 4, 1.0f, 0.0f, 0.1f);
    assert(near(s.median_x, 1.0f, 0.05f));
    assert(near(s.median_y, 0.0f, 0.05f));
    assert(s.within > 0.95f);
}

TEST(single_level_recovers_vertical_shift) {
    FlowEstimator est(single_level());
    const RgbImage previous = diagonal_texture(64, 64, 0.0f);
    const RgbImage current = diagonal_texture(64, 64, 0.0f, -1.0f);
    assert(est.compute(previous, current).success());

    const InteriorStats s = interior_stats(est, 4, 0.0f, -1.0f, 0.1f);
    assert(near(s.median_x, 0.0f, 0.1f));
    assert(near(s.median_y, -1.0f, 0.1f));
}

TEST(pyramid_recovers_larger_shift) {
    FlowEstimator::Config cfg;
    cfg.pyramid_levels = 3;
    cfg.iterations_per_level = 2;
    // A looser gate lets the finer levels polish residuals of a fraction of a pixel.
    cfg.kernel.confidence_threshold = 0.01f;
    FlowEstimator est(cfg);
    const RgbImage previous = diagonal_texture(96, 96, 0.0f);
    const RgbImage current = diagonal_texture(96, 96, 3.0f);
    assert(est.compute(previous, current).success());
    assert(est.levels_used() == 3);

    const InteriorStats s = interior_stats(est, 12, 3.0f, 0.0f, 0.35f);
    assert(near(s.median_x, 3.0f, 0.35f));
    assert(near(s.median_y, 0.0f, 0.35f));
}

TEST(estimation_is_deterministic) {
    FlowEstimator a;
    FlowEstimator b;
    const RgbImage previous = diagonal_texture(40, 32, 0.0f);
    const RgbImage current = diagonal_texture(40, 32, 1.5f);
    assert(a.compute(previous, current).success());
    assert(b.compute(previous, current).success());
    const size_t bytes = a.flow().plane_elements() * sizeof(half_bits);
    assert(std::memcmp(a.flow().x_plane(), b.flow().x_plane(), bytes) == 0);
    assert(std::memcmp(a.flow().y_plane(), b.flow().y_plane(), bytes) == 0);
}

#ifdef HAS_OPENMP
TEST(estimation_is_deterministic_across_threads) {
    const RgbImage previous = diagonal_texture(80, 64, 0.0f);
    const RgbImage current = diagonal_texture(80, 64, 2.0f, 0.5f);
    const int saved = omp_get_max_threads();

    FlowEstimator serial;
    omp_set_num_threads(1);
    assert(serial.compute(previous, current).success());

    FlowEstimator parallel;
    omp_set_num_threads(std::max(4, saved));
    assert(parallel.compute(previous, current).success());
    omp_set_num_threads(saved);

    const size_t bytes = serial.flow().plane_elements() * sizeof(half_bits);
    assert(std::memcmp(serial.flow().x_plane(), parallel.flow().x_plane(), bytes) == 0);
    assert(std::memcmp(serial.flow().y_plane(), parallel.flow().y_plane(), bytes) == 0);
}
#endif

TEST(compute_rejects_bad_input) {
    FlowEstimator est;
    const RgbImage a = diagonal_texture(32, 32, 0.0f);
    const RgbImage b = diagonal_texture(32, 16, 0.0f);

    Result r = est.compute(a, b);
    assert(r.error == ErrorCode::SIZE_MISMATCH);
    assert(!est.has_flow());

    r = est.compute(a, RgbImage());
    assert(r.error == ErrorCode::INVALID_ARGUMENT);

    FlowEstimator::Config bad;
    bad.pyramid_levels = 0;
    est.set_config(bad);
    r = est.compute(a, a);
    assert(r.error == ErrorCode::INVALID_ARGUMENT);
}

TEST(push_frame_history) {
    FlowEstimator est(single_level());
    assert(est.push_frame(diagonal_texture(64, 64, 0.0f)).success());
    assert(!est.has_flow());
    assert(est.frames_seen() == 1);

    assert(est.push_frame(diagonal_texture(64, 64, 1.0f)).success());
    assert(est.has_flow());
    assert(est.frames_seen() == 2);
    assert(near(interior_stats(est, 4, 1.0f, 0.0f, 0.1f).median_x, 1.0f, 0.1f));

    // Size change drops history; the next same-size frame produces flow again.
    const Result r = est.push_frame(diagonal_texture(32, 32, 0.0f));
    assert(r.error == ErrorCode::SIZE_MISMATCH);
    assert(!est.has_flow());
    assert(est.push_frame(diagonal_texture(32, 32, 0.0f)).success());
    assert(est.has_flow());
    assert(est.width() == 32);

    est.reset();
    assert(est.frames_seen() == 0 && !est.has_flow());
}

TEST(carry_over_seeds_next_pair) {
    FlowEstimator::Config cfg = single_level();
    cfg.carry_over = true;
    FlowEstimator est(cfg);
    assert(est.push_frame(diagonal_texture(64, 64, 0.0f)).success());
    assert(est.push_frame(diagonal_texture(64, 64, 1.0f)).success());
    assert(est.push_frame(diagonal_texture(64, 64, 2.0f)).success());
    // The seed already matches, so the gate leaves it in place.
    assert(near(interior_stats(est, 4, 1.0f, 0.0f, 0.15f).median_x, 1.0f, 0.15f));
}

TEST(mean_pixel_flow_of_empty) {
    FlowEstimator est;
    const PixelVector m = est.mean_pixel_flow();
    assert(m.x == 0.0f && m.y == 0.0f);
    const PixelVector p = est.pixel_flow(3, 3);
    assert(p.x == 0.0f && p.y == 0.0f);
}

int main() {
    std::cout << "=== Flow Estimator Test Suite ===\n\n";

    std::cout << "--- Pyramid and Flow Field ---\n";
    RUN_TEST(pyramid_levels_respect_min_size);
    RUN_TEST(blur_preserves_constant);
    RUN_TEST(flow_field_access);
    RUN_TEST(flow_field_resample_and_blur);

    std::cout << "\n--- Estimation ---\n";
    RUN_TEST(identical_frames_give_zero_flow);
    RUN_TEST(single_level_recovers_one_pixel_shift);
    RUN_TEST(symmetric_gradient_recovers_shift_per_pixel);
    RUN_TEST(single_level_recovers_vertical_shift);
    RUN_TEST(pyramid_recovers_larger_shift);
    RUN_TEST(estimation_is_deterministic);
#ifdef HAS_OPENMP
    RUN_TEST(estimation_is_deterministic_across_threads);
#endif
    RUN_TEST(compute_rejects_bad_input);

    std::cout << "\n--- Frame Stream ---\n";
    RUN_TEST(push_frame_history);
    RUN_TEST(carry_over_seeds_next_pair);
    RUN_TEST(mean_pixel_flow_of_empty);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    return failures == 0 ? 0 : 1;
}
