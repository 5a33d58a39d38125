#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>

namespace chromaflow {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_config_home() {
#if defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

uint32_t hash_combine(uint32_t a, uint32_t b) {
    a ^= b + 0x9e3779b9 + (a << 6) + (a >> 2);
    return a;
}

uint32_t hash_float(float f) {
    uint32_t u;
    std::memcpy(&u, &f, sizeof(f));
    return u;
}

uint32_t hash_int(int i) {
    return static_cast<uint32_t>(i);
}

template <typename T>
void read_into(const toml::node_view<toml::node>& tbl, const char* key, T& out) {
    if (auto v = tbl[key].value<T>()) out = *v;
}

}  // namespace

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_config_home() + "/chromaflow";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (pyramid.levels < 1 || pyramid.levels > 12) {
        error = "pyramid.levels must be between 1 and 12";
        return false;
    }
    if (pyramid.min_level_size < 2 || pyramid.min_level_size > 4096) {
        error = "pyramid.min_level_size must be between 2 and 4096";
        return false;
    }
    if (pyramid.frame_blur_sigma < 0.0f || pyramid.frame_blur_sigma > 10.0f) {
        error = "pyramid.frame_blur_sigma must be between 0.0 and 10.0";
        return false;
    }
    if (pyramid.flow_blur_sigma < 0.0f || pyramid.flow_blur_sigma > 10.0f) {
        error = "pyramid.flow_blur_sigma must be between 0.0 and 10.0";
        return false;
    }
    if (pyramid.iterations < 1 || pyramid.iterations > 16) {
        error = "pyramid.iterations must be between 1 and 16";
        return false;
    }
    if (kernel.window_radius < 0 || kernel.window_radius > 8) {
        error = "kernel.window_radius must be between 0 and 8";
        return false;
    }
    if (kernel.rotation_degrees < -360.0f || kernel.rotation_degrees > 360.0f) {
        error = "kernel.rotation_degrees must be between -360 and 360";
        return false;
    }
    if (kernel.window_spacing <= 0.0f || kernel.window_spacing > 16.0f) {
        error = "kernel.window_spacing must be in (0, 16]";
        return false;
    }
    if (kernel.confidence_threshold < 0.0f || kernel.confidence_threshold > 100.0f) {
        error = "kernel.confidence_threshold must be between 0 and 100";
        return false;
    }
    if (visualize.max_motion < 0.0f) {
        error = "visualize.max_motion must be >= 0 (0 = auto)";
        return false;
    }
    if (visualize.background_blend < 0.0f || visualize.background_blend > 1.0f) {
        error = "visualize.background_blend must be between 0.0 and 1.0";
        return false;
    }
    if (output.keyframe_interval < 1) {
        error = "output.keyframe_interval must be >= 1";
        return false;
    }
    if (output.bitrate < 100000) {
        error = "output.bitrate must be >= 100000";
        return false;
    }
    if (input.max_frames < 0) {
        error = "input.max_frames must be >= 0";
        return false;
    }
    if (fps < 0 || fps > 240) {
        error = "fps must be between 0 (source rate) and 240";
        return false;
    }
    return true;
}

std::string Config::compute_hash() const {
    uint32_t h = 0;

    h = hash_combine(h, hash_int(version));
    h = hash_combine(h, hash_int(static_cast<int>(input.linearize)));
    h = hash_combine(h, hash_int(pyramid.levels));
    h = hash_combine(h, hash_int(pyramid.min_level_size));
    h = hash_combine(h, hash_float(pyramid.frame_blur_sigma));
    h = hash_combine(h, hash_float(pyramid.flow_blur_sigma));
    h = hash_combine(h, hash_int(pyramid.iterations));
    h = hash_combine(h, hash_int(static_cast<int>(pyramid.carry_over)));
    h = hash_combine(h, hash_int(kernel.window_radius));
    h = hash_combine(h, hash_float(kernel.rotation_degrees));
    h = hash_combine(h, hash_float(kernel.window_spacing));
    h = hash_combine(h, hash_float(kernel.confidence_threshold));
    h = hash_combine(h, hash_int(static_cast<int>(kernel.symmetric_gradient)));

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << h;
    return ss.str();
}

FlowEstimator::Config Config::estimator_config() const {
    FlowEstimator::Config ec;
    ec.pyramid_levels = pyramid.levels;
    ec.min_level_size = pyramid.min_level_size;
    ec.frame_blur_sigma = pyramid.frame_blur_sigma;
    ec.flow_blur_sigma = pyramid.flow_blur_sigma;
    ec.iterations_per_level = pyramid.iterations;
    ec.carry_over = pyramid.carry_over;
    ec.kernel.window_radius = kernel.window_radius;
    ec.kernel.rotation_degrees = kernel.rotation_degrees;
    ec.kernel.window_spacing = kernel.window_spacing;
    ec.kernel.confidence_threshold = kernel.confidence_threshold;
    ec.kernel.symmetric_gradient = kernel.symmetric_gradient;
    return ec;
}

FlowVisualizer::Config Config::visualizer_config() const {
    FlowVisualizer::Config vc;
    vc.max_motion = visualize.max_motion;
    vc.background_blend = visualize.background_blend;
    return vc;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        if (error) *error = "config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                if (error) *error = "unsupported config_version " + std::to_string(*v);
                return std::nullopt;
            }
        }
        if (auto v = tbl["fps"].value<int>()) cfg.fps = *v;

        if (auto input = tbl["input"]) {
            read_into(input, "source", cfg.input.source);
            read_into(input, "linearize", cfg.input.linearize);
            read_into(input, "max_frames", cfg.input.max_frames);
        }

        if (auto output = tbl["output"]) {
            read_into(output, "video", cfg.output.video);
            read_into(output, "archive", cfg.output.archive);
            read_into(output, "keyframe_interval", cfg.output.keyframe_interval);
            read_into(output, "bitrate", cfg.output.bitrate);
            read_into(output, "codec", cfg.output.codec);
        }

        if (auto pyramid = tbl["pyramid"]) {
            read_into(pyramid, "levels", cfg.pyramid.levels);
            read_into(pyramid, "min_level_size", cfg.pyramid.min_level_size);
            read_into(pyramid, "frame_blur_sigma", cfg.pyramid.frame_blur_sigma);
            read_into(pyramid, "flow_blur_sigma", cfg.pyramid.flow_blur_sigma);
            read_into(pyramid, "iterations", cfg.pyramid.iterations);
            read_into(pyramid, "carry_over", cfg.pyramid.carry_over);
        }

        if (auto kernel = tbl["kernel"]) {
            read_into(kernel, "window_radius", cfg.kernel.window_radius);
            read_into(kernel, "rotation_degrees", cfg.kernel.rotation_degrees);
            read_into(kernel, "window_spacing", cfg.kernel.window_spacing);
            read_into(kernel, "confidence_threshold", cfg.kernel.confidence_threshold);
            read_into(kernel, "symmetric_gradient", cfg.kernel.symmetric_gradient);
        }

        if (auto visualize = tbl["visualize"]) {
            read_into(visualize, "max_motion", cfg.visualize.max_motion);
            read_into(visualize, "background_blend", cfg.visualize.background_blend);
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        if (error) *error = std::string("parse error: ") + std::string(e.description());
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    return load(default_config_path());
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.input.empty()) config.input.source = args.input;
    if (!args.output.empty()) config.output.video = args.output;
    if (!args.archive_path.empty()) config.output.archive = args.archive_path;

    if (args.fps > 0) config.fps = args.fps;
    if (args.max_frames > 0) config.input.max_frames = args.max_frames;
    if (args.linearize) config.input.linearize = true;
    if (args.stats) config.stats = true;

    if (args.levels > 0) config.pyramid.levels = args.levels;
    if (args.iterations > 0) config.pyramid.iterations = args.iterations;
    if (args.frame_blur >= 0.0f) config.pyramid.frame_blur_sigma = args.frame_blur;
    if (args.flow_blur >= 0.0f) config.pyramid.flow_blur_sigma = args.flow_blur;
    if (args.carry_over) config.pyramid.carry_over = true;

    if (args.window_radius >= 0) config.kernel.window_radius = args.window_radius;
    if (args.rotation_set) config.kernel.rotation_degrees = args.rotation_degrees;
    if (args.confidence >= 0.0f) config.kernel.confidence_threshold = args.confidence;
    if (args.symmetric_gradient) config.kernel.symmetric_gradient = true;

    if (args.max_motion >= 0.0f) config.visualize.max_motion = args.max_motion;

    return config;
}

}
