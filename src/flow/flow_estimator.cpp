#include "flow/flow_estimator.hpp"
#include "flow/fixed_range.hpp"
#include "flow/vector_normalization.hpp"
#include <algorithm>
#include <string>
#include <utility>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace chromaflow {

FlowEstimator::FlowEstimator(const Config& config)
    : config_(config), kernel_(config.kernel) {}

void FlowEstimator::set_config(const Config& config) {
    config_ = config;
    kernel_ = FlowKernel(config.kernel);
    reset();
}

Result FlowEstimator::validate_config() const {
    if (config_.pyramid_levels < 1) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "pyramid_levels must be >= 1");
    }
    if (config_.min_level_size < 1) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "min_level_size must be >= 1");
    }
    if (config_.iterations_per_level < 1) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "iterations_per_level must be >= 1");
    }
    if (config_.kernel.window_radius < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "window_radius must be >= 0");
    }
    return Result::ok();
}

ImagePyramid::Config FlowEstimator::pyramid_config() const {
    ImagePyramid::Config pc;
    pc.levels = config_.pyramid_levels;
    pc.min_level_size = config_.min_level_size;
    pc.blur_sigma = config_.frame_blur_sigma;
    return pc;
}

Result FlowEstimator::compute(const RgbImage& previous, const RgbImage& current) {
    Result valid = validate_config();
    if (valid.failure()) return valid;
    if (previous.empty() || current.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "empty frame");
    }
    if (previous.width() != current.width() || previous.height() != current.height()) {
        return Result::fail(ErrorCode::SIZE_MISMATCH,
                            "frame size changed from " + std::to_string(previous.width()) + "x" +
                            std::to_string(previous.height()) + " to " +
                            std::to_string(current.width()) + "x" +
                            std::to_string(current.height()));
    }

    const ImagePyramid::Config pc = pyramid_config();
    ImagePyramid prev_pyr;
    ImagePyramid curr_pyr;
    prev_pyr.build(previous, pc);
    curr_pyr.build(current, pc);
    estimate(prev_pyr, curr_pyr);
    return Result::ok();
}

Result FlowEstimator::push_frame(const RgbImage& frame) {
    Result valid = validate_config();
    if (valid.failure()) return valid;
    if (frame.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "empty frame");
    }

    ImagePyramid curr_pyr;
    curr_pyr.build(frame, pyramid_config());

    if (!previous_pyramid_.empty()) {
        const RgbImage& last = previous_pyramid_.level(0);
        if (last.width() != frame.width() || last.height() != frame.height()) {
            previous_pyramid_ = std::move(curr_pyr);
            flow_ = FlowField();
            ++frames_seen_;
            return Result::fail(ErrorCode::SIZE_MISMATCH, "frame size changed; flow history reset");
        }
        estimate(previous_pyramid_, curr_pyr);
    }

    previous_pyramid_ = std::move(curr_pyr);
    ++frames_seen_;
    return Result::ok();
}

void FlowEstimator::estimate(const ImagePyramid& previous, const ImagePyramid& current) {
    const int levels = std::min(previous.level_count(), current.level_count());
    const RgbImage& coarsest = current.level(levels - 1);

    FlowField incoming(coarsest.width(), coarsest.height());
    if (config_.carry_over && !flow_.empty() &&
        flow_.width() == current.level(0).width() && flow_.height() == current.level(0).height()) {
        incoming = flow_.resampled(coarsest.width(), coarsest.height());
    }

    for (int level = levels - 1; level >= 0; --level) {
        const RgbImage& img = current.level(level);
        if (incoming.width() != img.width() || incoming.height() != img.height()) {
            incoming = incoming.resampled(img.width(), img.height());
        }
        for (int it = 0; it < config_.iterations_per_level; ++it) {
            incoming = refine_level(previous, current, level, incoming);
        }
        incoming = incoming.blurred(config_.flow_blur_sigma);
    }

    flow_ = std::move(incoming);
    levels_used_ = levels;
}

FlowField FlowEstimator::refine_level(const ImagePyramid& previous, const ImagePyramid& current,
                                      int level, const FlowField& incoming) const {
    const int w = current.level(level).width();
    const int h = current.level(level).height();

    const MipmappedFrameSampler curr_sampler(current.chain_from(level));
    const MipmappedFrameSampler prev_sampler(previous.chain_from(level));

    FlowField out(w, h);
#ifdef HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const PixelInvocation inv = PixelInvocation::for_pixel(x, y, w, h);
            out.set_encoded(x, y, kernel_.refine(inv, incoming.encoded(x, y), curr_sampler, prev_sampler));
        }
    }
    return out;
}

NormalizedVector FlowEstimator::normalized_flow(int x, int y) const {
    return flow_.normalized(x, y);
}

PixelVector FlowEstimator::pixel_flow(int x, int y) const {
    if (flow_.empty()) return PixelVector();
    const Vec2 pixel_size(1.0f / static_cast<float>(flow_.width()),
                          1.0f / static_cast<float>(flow_.height()));
    return to_pixel(flow_.normalized(x, y), pixel_size);
}

PixelVector FlowEstimator::mean_pixel_flow() const {
    if (flow_.empty()) return PixelVector();
    double sx = 0.0;
    double sy = 0.0;
    for (int y = 0; y < flow_.height(); ++y) {
        for (int x = 0; x < flow_.width(); ++x) {
            const PixelVector p = pixel_flow(x, y);
            sx += p.x;
            sy += p.y;
        }
    }
    const double n = static_cast<double>(flow_.width()) * flow_.height();
    return PixelVector(static_cast<float>(sx / n), static_cast<float>(sy / n));
}

void FlowEstimator::reset() {
    previous_pyramid_.clear();
    flow_ = FlowField();
    frames_seen_ = 0;
    levels_used_ = 0;
}

}
