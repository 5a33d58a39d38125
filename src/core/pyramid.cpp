#include "core/pyramid.hpp"
#include <algorithm>
#include <cmath>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace chromaflow {

namespace {

constexpr int kCacheTile = 64;

std::vector<float> gaussian_kernel(float sigma, int& radius) {
    radius = static_cast<int>(std::ceil(sigma * 3));
    const int ksize = 2 * radius + 1;

    std::vector<float> kernel(ksize);
    float sum = 0.0f;
    for (int i = 0; i < ksize; ++i) {
        float x = static_cast<float>(i - radius);
        kernel[i] = std::exp(-x * x / (2 * sigma * sigma));
        sum += kernel[i];
    }
    for (float& k : kernel) k /= sum;
    return kernel;
}

}  // namespace

FloatImage gaussian_blur(const FloatImage& input, float sigma) {
    const int w = input.width();
    const int h = input.height();

    if (sigma <= 0.0f || input.empty()) {
        return input;
    }

    int radius = 0;
    const std::vector<float> kernel = gaussian_kernel(sigma, radius);
    const int ksize = static_cast<int>(kernel.size());

    FloatImage temp(w, h);
    const float* in_data = input.data();
    float* temp_data = temp.data();
#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < h; ++y) {
        const float* in_row = in_data + static_cast<size_t>(y) * w;
        float* temp_row = temp_data + static_cast<size_t>(y) * w;
        for (int tx = 0; tx < w; tx += kCacheTile) {
            int x_end = std::min(tx + kCacheTile, w);
            for (int x = tx; x < x_end; ++x) {
                float val = 0.0f;
                float wsum = 0.0f;
                for (int k = 0; k < ksize; ++k) {
                    int nx = x + k - radius;
                    if (nx >= 0 && nx < w) {
                        val += in_row[nx] * kernel[k];
                        wsum += kernel[k];
                    }
                }
                temp_row[x] = val / std::max(wsum, 1e-12f);
            }
        }
    }

    FloatImage result(w, h);
    const float* temp_ro = temp.data();
    float* out_data = result.data();
#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < h; ++y) {
        float* out_row = out_data + static_cast<size_t>(y) * w;
        for (int x = 0; x < w; ++x) {
            float val = 0.0f;
            float wsum = 0.0f;
            for (int k = 0; k < ksize; ++k) {
                int ny = y + k - radius;
                if (ny >= 0 && ny < h) {
                    val += temp_ro[static_cast<size_t>(ny) * w + x] * kernel[k];
                    wsum += kernel[k];
                }
            }
            out_row[x] = val / std::max(wsum, 1e-12f);
        }
    }

    return result;
}

RgbImage gaussian_blur(const RgbImage& input, float sigma) {
    return RgbImage(gaussian_blur(input.r, sigma),
                    gaussian_blur(input.g, sigma),
                    gaussian_blur(input.b, sigma));
}

FloatImage downsample_half(const FloatImage& input) {
    const int src_w = input.width();
    const int src_h = input.height();
    const int dst_w = std::max(1, src_w / 2);
    const int dst_h = std::max(1, src_h / 2);

    FloatImage out(dst_w, dst_h);
    for (int y = 0; y < dst_h; ++y) {
        const int sy0 = y * 2;
        const int sy1 = (y == dst_h - 1) ? src_h : std::min(sy0 + 2, src_h);
        for (int x = 0; x < dst_w; ++x) {
            const int sx0 = x * 2;
            const int sx1 = (x == dst_w - 1) ? src_w : std::min(sx0 + 2, src_w);
            float sum = 0.0f;
            int cnt = 0;
            for (int sy = sy0; sy < sy1; ++sy) {
                for (int sx = sx0; sx < sx1; ++sx) {
                    sum += input.get(sx, sy);
                    cnt++;
                }
            }
            out.set(x, y, cnt > 0 ? sum / cnt : 0.0f);
        }
    }
    return out;
}

RgbImage downsample_half(const RgbImage& input) {
    return RgbImage(downsample_half(input.r), downsample_half(input.g), downsample_half(input.b));
}

void ImagePyramid::build(const RgbImage& image, const Config& config) {
    levels_.clear();
    if (image.empty()) {
        return;
    }

    const int capped_levels = std::max(1, config.levels);
    const int min_size = std::max(1, config.min_level_size);
    levels_.reserve(static_cast<size_t>(capped_levels));
    levels_.push_back(gaussian_blur(image, config.blur_sigma));

    for (int l = 1; l < capped_levels; ++l) {
        const RgbImage& src = levels_.back();
        if (src.width() / 2 < min_size || src.height() / 2 < min_size) {
            break;
        }
        // Blur, then 2x2 decimate.
        levels_.push_back(downsample_half(gaussian_blur(src, config.blur_sigma)));
    }
}

std::vector<const RgbImage*> ImagePyramid::chain_from(int index) const {
    std::vector<const RgbImage*> chain;
    for (int l = std::max(index, 0); l < level_count(); ++l) {
        chain.push_back(&levels_[static_cast<size_t>(l)]);
    }
    return chain;
}

}
