#pragma once

#include "core/types.hpp"
#include "flow/flow_types.hpp"
#include <vector>

namespace chromaflow {

// Texture fetch used by the flow kernel. Coordinates are in [0,1] texture
// space; ddx/ddy are the screen-space derivatives of the coordinate and pick
// the level of detail, so the fetch stays correct when the caller warps the
// coordinate.
class FrameSampler {
public:
    virtual ~FrameSampler() = default;
    virtual ColorSample sample(const Vec2& coord, const Vec2& ddx, const Vec2& ddy) const = 0;
};

// Clamp-to-edge bilinear fetch from a single image. Pixel centers sit at
// (i + 0.5) / size.
ColorSample sample_bilinear(const RgbImage& image, const Vec2& coord);

class MipmappedFrameSampler : public FrameSampler {
public:
    MipmappedFrameSampler() = default;
    explicit MipmappedFrameSampler(const RgbImage& image);
    // levels[0] is the finest level; each following level halves the size.
    explicit MipmappedFrameSampler(std::vector<const RgbImage*> levels);

    ColorSample sample(const Vec2& coord, const Vec2& ddx, const Vec2& ddy) const override;

    float level_of_detail(const Vec2& ddx, const Vec2& ddy) const;
    int level_count() const { return static_cast<int>(levels_.size()); }

private:
    std::vector<const RgbImage*> levels_;
};

}
