#pragma once

#include "core/types.hpp"
#include "flow/flow_estimator.hpp"
#include "render/flow_visualizer.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace chromaflow {

constexpr int CONFIG_VERSION = 1;

struct ConfigInput {
    std::string source;
    bool linearize = false;
    // 0 reads the whole source.
    int max_frames = 0;
};

struct ConfigOutput {
    std::string video;
    std::string archive;
    int keyframe_interval = 30;
    int bitrate = 4000000;
    std::string codec = "libx264";
};

struct ConfigPyramid {
    int levels = 4;
    int min_level_size = 8;
    float frame_blur_sigma = 1.0f;
    float flow_blur_sigma = 1.0f;
    int iterations = 1;
    bool carry_over = false;
};

struct ConfigKernel {
    int window_radius = 1;
    float rotation_degrees = 45.0f;
    float window_spacing = 1.0f;
    float confidence_threshold = 0.1f;
    bool symmetric_gradient = false;
};

struct ConfigVisualize {
    float max_motion = 0.0f;
    float background_blend = 0.0f;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigInput input;
    ConfigOutput output;
    ConfigPyramid pyramid;
    ConfigKernel kernel;
    ConfigVisualize visualize;

    std::string config_path;
    int fps = 0;
    bool stats = false;

    // Covers only the settings that change the computed flow.
    std::string compute_hash() const;
    bool validate(std::string& error) const;

    FlowEstimator::Config estimator_config() const;
    FlowVisualizer::Config visualizer_config() const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

}
