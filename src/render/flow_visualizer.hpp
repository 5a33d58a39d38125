#pragma once

#include "core/types.hpp"
#include "flow/flow_field.hpp"

namespace chromaflow {

// HSV flow coding: hue is the direction, value the magnitude relative to
// max_motion, saturation 1. Zero motion renders black.
class FlowVisualizer {
public:
    struct Config {
        // Pixels per frame mapped to full brightness; <= 0 scales by the
        // largest magnitude in the frame.
        float max_motion = 0.0f;
        // Draw the source frame dimmed underneath instead of black.
        float background_blend = 0.0f;
    };

    FlowVisualizer() = default;
    explicit FlowVisualizer(const Config& config) : config_(config) {}

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    FrameBuffer render(const FlowField& field) const;
    FrameBuffer render(const FlowField& field, const FrameBuffer& background) const;

    // Magnitude that maps to full value in the last render.
    float last_scale() const { return last_scale_; }

private:
    Config config_;
    mutable float last_scale_ = 0.0f;
};

}
