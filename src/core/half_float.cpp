#include "core/half_float.hpp"
#include <cmath>
#include <cstring>

namespace chromaflow {

namespace {

constexpr uint32_t F32_ABS_MASK = 0x7FFFFFFFu;
constexpr uint32_t F32_INF_BITS = 0x7F800000u;
constexpr uint32_t F32_HALF_MAX_BITS = 0x477FE000u;      // 65504.0f
constexpr uint32_t F32_HALF_MIN_NORMAL_BITS = 0x38800000u; // 2^-14
constexpr uint32_t F32_HALF_ROUND_ZERO_BITS = 0x33000000u; // 2^-25

}  // namespace

half_bits float_to_half(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));

    const uint16_t sign = static_cast<uint16_t>((bits >> 16) & 0x8000u);
    const uint32_t abs_bits = bits & F32_ABS_MASK;

    if (abs_bits > F32_INF_BITS) {
        return 0;
    }
    if (abs_bits >= F32_HALF_MAX_BITS) {
        return static_cast<half_bits>(sign | HALF_MAX_FINITE_BITS);
    }

    if (abs_bits < F32_HALF_MIN_NORMAL_BITS) {
        if (abs_bits <= F32_HALF_ROUND_ZERO_BITS) {
            return sign;
        }
        // Subnormal half: value = m * 2^-24.
        const uint32_t mant = (abs_bits & 0x007FFFFFu) | 0x00800000u;
        const int shift = 126 - static_cast<int>(abs_bits >> 23);
        uint32_t half_mant = mant >> shift;
        const uint32_t rem = mant & ((1u << shift) - 1u);
        const uint32_t halfway = 1u << (shift - 1);
        if (rem > halfway || (rem == halfway && (half_mant & 1u))) {
            ++half_mant;
        }
        return static_cast<half_bits>(sign | half_mant);
    }

    const uint32_t exponent = (abs_bits >> 23) - 112u;
    const uint32_t mant = abs_bits & 0x007FFFFFu;
    uint32_t h = (exponent << 10) | (mant >> 13);
    const uint32_t rem = mant & 0x1FFFu;
    if (rem > 0x1000u || (rem == 0x1000u && (h & 1u))) {
        ++h;
    }
    return static_cast<half_bits>(sign | h);
}

float half_to_float(half_bits h) {
    const uint32_t sign = static_cast<uint32_t>(h & 0x8000u) << 16;
    const uint32_t exponent = (h >> 10) & 0x1Fu;
    const uint32_t mant = h & 0x3FFu;

    if (exponent == 0) {
        float v = std::ldexp(static_cast<float>(mant), -24);
        return sign ? -v : v;
    }

    uint32_t bits;
    if (exponent == 31) {
        bits = sign | F32_INF_BITS | (mant << 13);
    } else {
        bits = sign | ((exponent + 112u) << 23) | (mant << 13);
    }
    float out;
    std::memcpy(&out, &bits, sizeof(out));
    return out;
}

}
