#pragma once

#include "flow/flow_types.hpp"

namespace chromaflow {

// Spherical chromaticity angles of an RGB sample. Scaling the sample by any
// positive factor leaves the result unchanged, so gradients taken on it are
// insensitive to shading and exposure changes.
//
// azimuth   = asin(|g| / |(r,g)|)   * 2/pi, 1/sqrt(2) ratio when |(r,g)| == 0
// elevation = asin(|(r,g)| / |rgb|) * 2/pi, 1/sqrt(3) ratio when |rgb| == 0
InvariantSample color_invariant(const ColorSample& color);

}
