#pragma once

#include "core/pyramid.hpp"
#include "core/types.hpp"
#include "flow/flow_field.hpp"
#include "flow/refine_flow.hpp"

namespace chromaflow {

// Coarse-to-fine driver around FlowKernel. Levels run coarsest first; the
// refined field of each level is blurred and resampled as the incoming field
// of the next finer level.
class FlowEstimator {
public:
    struct Config {
        int pyramid_levels = 4;
        int min_level_size = 8;
        float frame_blur_sigma = 1.0f;
        float flow_blur_sigma = 1.0f;
        int iterations_per_level = 1;
        // Seed the coarsest level with the previous frame pair's flow.
        bool carry_over = false;
        FlowKernelParams kernel;
    };

    FlowEstimator() = default;
    explicit FlowEstimator(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    Result compute(const RgbImage& previous, const RgbImage& current);

    // Keeps the pyramid of the last frame; computes flow from the second
    // frame on.
    Result push_frame(const RgbImage& frame);

    const FlowField& flow() const { return flow_; }
    bool has_flow() const { return !flow_.empty(); }
    int width() const { return flow_.width(); }
    int height() const { return flow_.height(); }
    int frames_seen() const { return frames_seen_; }
    int levels_used() const { return levels_used_; }

    NormalizedVector normalized_flow(int x, int y) const;
    PixelVector pixel_flow(int x, int y) const;
    PixelVector mean_pixel_flow() const;

    void reset();

private:
    Config config_;
    FlowKernel kernel_;
    ImagePyramid previous_pyramid_;
    FlowField flow_;
    int frames_seen_ = 0;
    int levels_used_ = 0;

    Result validate_config() const;
    ImagePyramid::Config pyramid_config() const;
    void estimate(const ImagePyramid& previous, const ImagePyramid& current);
    FlowField refine_level(const ImagePyramid& previous, const ImagePyramid& current,
                           int level, const FlowField& incoming) const;
};

}
