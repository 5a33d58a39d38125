#pragma once

#include "core/types.hpp"
#include <vector>

namespace chromaflow {

// Separable Gaussian, radius ceil(3 sigma), weights renormalized where the
// kernel leaves the image. sigma <= 0 returns a copy.
FloatImage gaussian_blur(const FloatImage& input, float sigma);
RgbImage gaussian_blur(const RgbImage& input, float sigma);

// 2x2 area average; odd trailing rows/columns fold into the last output pixel.
FloatImage downsample_half(const FloatImage& input);
RgbImage downsample_half(const RgbImage& input);

class ImagePyramid {
public:
    struct Config {
        int levels = 4;
        int min_level_size = 8;
        float blur_sigma = 1.0f;
    };

    ImagePyramid() = default;

    void build(const RgbImage& image, const Config& config);
    void clear() { levels_.clear(); }

    int level_count() const { return static_cast<int>(levels_.size()); }
    bool empty() const { return levels_.empty(); }
    const RgbImage& level(int index) const { return levels_.at(static_cast<size_t>(index)); }

    // Levels index..end, finest first, for mip-mapped sampling.
    std::vector<const RgbImage*> chain_from(int index) const;

private:
    std::vector<RgbImage> levels_;
};

}
