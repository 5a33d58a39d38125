#pragma once

#include "flow/flow_types.hpp"

namespace chromaflow {

constexpr float DEFAULT_CONFIDENCE_THRESHOLD = 0.1f;

// 1 when the window's residual energy exceeds `threshold` times its gradient
// energy, 0 otherwise (including windows with no gradient energy at all).
float confidence_mask(const StructureTensor& tensor, float threshold = DEFAULT_CONFIDENCE_THRESHOLD);

// Closed-form solve of the masked 2x2 normal equations. Returns (0,0) when
// the masked tensor is singular or indefinite.
PixelVector solve_flow(const StructureTensor& tensor, float threshold = DEFAULT_CONFIDENCE_THRESHOLD);

}
