#include "flow/color_invariant.hpp"
#include <algorithm>
#include <cmath>

namespace chromaflow {

namespace {

constexpr float INV_SQRT2 = 0.70710678118654752f;
constexpr float INV_SQRT3 = 0.57735026918962576f;
constexpr float TWO_OVER_PI = 0.63661977236758134f;

float angle01(float ratio) {
    const float r = std::abs(ratio);
    if (std::isnan(r)) {
        return 0.0f;
    }
    const float a = std::asin(std::min(r, 1.0f)) * TWO_OVER_PI;
    return std::clamp(a, 0.0f, 1.0f);
}

}  // namespace

InvariantSample color_invariant(const ColorSample& input) {
    // The ratios are scale-free; normalizing by the largest component keeps
    // the squared lengths inside float range.
    const float largest = std::max({std::abs(input.r), std::abs(input.g), std::abs(input.b)});
    const ColorSample color = (largest > 0.0f && std::isfinite(largest)) ? input * (1.0f / largest) : input;

    const float rg_length = std::sqrt(color.r * color.r + color.g * color.g);
    const float rgb_length = std::sqrt(rg_length * rg_length + color.b * color.b);

    const float azimuth_ratio = (rg_length > 0.0f) ? color.g / rg_length : INV_SQRT2;
    const float elevation_ratio = (rgb_length > 0.0f) ? rg_length / rgb_length : INV_SQRT3;

    return InvariantSample(angle01(azimuth_ratio), angle01(elevation_ratio));
}

}
