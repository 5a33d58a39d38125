#pragma once

#include "flow/flow_types.hpp"
#include <algorithm>

namespace chromaflow {

struct StorageFormat {
    int exponent_bits = 5;
    int significand_bits = 10;
};

constexpr StorageFormat HALF_FORMAT{5, 10};
constexpr StorageFormat SINGLE_FORMAT{8, 23};

// Largest finite magnitude of an IEEE-style binary format. The all-ones
// exponent is reserved, so the top usable exponent equals the bias.
constexpr double max_finite_magnitude(const StorageFormat& format) {
    const int bias = (1 << (format.exponent_bits - 1)) - 1;
    double scale = 1.0;
    for (int i = 0; i < bias; ++i) {
        scale *= 2.0;
    }
    double significand_steps = 1.0;
    for (int i = 0; i < format.significand_bits; ++i) {
        significand_steps *= 2.0;
    }
    return scale * (1.0 + (significand_steps - 1.0) / significand_steps);
}

constexpr float FIXED_RANGE_MAX = static_cast<float>(max_finite_magnitude(HALF_FORMAT));
static_assert(FIXED_RANGE_MAX == 65504.0f, "binary16 max finite magnitude");

inline NormalizedVector decode_to_normalized(const EncodedVector& encoded) {
    return (encoded / FIXED_RANGE_MAX).clamped(-1.0f, 1.0f);
}

inline EncodedVector encode_from_normalized(const NormalizedVector& normalized) {
    return normalized * FIXED_RANGE_MAX;
}

}
