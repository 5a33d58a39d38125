#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace chromaflow {

enum class ErrorCode {
    SUCCESS = 0,
    SIZE_MISMATCH,
    INVALID_ARGUMENT
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    Vec2() = default;
    Vec2(float x, float y) : x(x), y(y) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(const Vec2& o) const { return {x * o.x, y * o.y}; }
    Vec2 operator/(const Vec2& o) const { return {x / o.x, y / o.y}; }
    Vec2 operator*(float s) const { return {x * s, y * s}; }
    Vec2 operator/(float s) const { return {x / s, y / s}; }
    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    float length() const { return std::sqrt(x * x + y * y); }
    Vec2 abs() const { return {std::abs(x), std::abs(y)}; }
    Vec2 clamped(float lo, float hi) const {
        return {std::clamp(x, lo, hi), std::clamp(y, lo, hi)};
    }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    static Color from_float(float rf, float gf, float bf, float af = 1.0f) {
        return Color(
            static_cast<uint8_t>(std::clamp(rf * 255.0f + 0.5f, 0.0f, 255.0f)),
            static_cast<uint8_t>(std::clamp(gf * 255.0f + 0.5f, 0.0f, 255.0f)),
            static_cast<uint8_t>(std::clamp(bf * 255.0f + 0.5f, 0.0f, 255.0f)),
            static_cast<uint8_t>(std::clamp(af * 255.0f + 0.5f, 0.0f, 255.0f))
        );
    }
};

class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                set_pixel(x, y, c);
            }
        }
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

class FloatImage {
public:
    FloatImage() = default;
    FloatImage(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h, 0.0f) {}
    FloatImage(int w, int h, float fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h, fill) {}

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    const float* data() const { return data_.data(); }
    float* data() { return data_.data(); }

    float get(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return 0.0f;
        return data_[static_cast<size_t>(y) * width_ + x];
    }

    void set(int x, int y, float v) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        data_[static_cast<size_t>(y) * width_ + x] = v;
    }

    void fill(float v) {
        std::fill(data_.begin(), data_.end(), v);
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<float> data_;
};

// Planar float RGB, channel values nominally in [0,1].
class RgbImage {
public:
    RgbImage() = default;
    RgbImage(int w, int h) : r(w, h), g(w, h), b(w, h) {}
    RgbImage(FloatImage red, FloatImage green, FloatImage blue)
        : r(std::move(red)), g(std::move(green)), b(std::move(blue)) {}

    int width() const { return r.width(); }
    int height() const { return r.height(); }
    Size size() const { return r.size(); }
    bool empty() const { return r.empty(); }

    void set(int x, int y, float rv, float gv, float bv) {
        r.set(x, y, rv);
        g.set(x, y, gv);
        b.set(x, y, bv);
    }

    FloatImage r;
    FloatImage g;
    FloatImage b;
};

}
