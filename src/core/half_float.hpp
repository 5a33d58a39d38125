#pragma once

#include <cstdint>

namespace chromaflow {

// IEEE 754 binary16 bit pattern.
using half_bits = uint16_t;

constexpr half_bits HALF_MAX_FINITE_BITS = 0x7BFF;

// Round-to-nearest-even. Magnitudes at or beyond the largest finite half
// saturate to +/-65504 and NaN is stored as +0, so a stored value is always
// finite.
half_bits float_to_half(float value);
float half_to_float(half_bits bits);

inline float quantize_to_half(float value) {
    return half_to_float(float_to_half(value));
}

}
