#include "core/types.hpp"
#include "core/config.hpp"
#include "core/color_space.hpp"
#include "core/flow_archive.hpp"
#include "core/frame_source.hpp"
#include "flow/flow_estimator.hpp"
#include "render/flow_visualizer.hpp"
#include "render/video_encoder.hpp"
#include "cli/args.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted.store(true);
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

int main(int argc, char* argv[]) {
    chromaflow::Args args = chromaflow::parse_args(argc, argv);

    if (args.show_help) {
        chromaflow::print_help(argv[0]);
        return 0;
    }
    if (!args.errors.empty()) {
        for (const auto& e : args.errors) {
            std::cerr << "Error: " << e << "\n";
        }
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return 2;
    }

    chromaflow::Config config = chromaflow::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = chromaflow::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path
                      << " (" << load_error << ")\n";
            return 1;
        }
        config = *loaded;
    } else if (auto loaded_default = chromaflow::Config::load_default()) {
        config = *loaded_default;
    }
    config = chromaflow::apply_cli_overrides(config, args);

    if (config.input.source.empty()) {
        std::cerr << "Error: No input specified\n";
        chromaflow::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    chromaflow::ColorSpace::init();

    auto source = chromaflow::create_source(config.input.source);
    if (!source->open(config.input.source)) {
        std::cerr << "Error: Failed to open input: " << config.input.source << "\n";
        return 1;
    }
    if (source->fps() == 0.0) {
        std::cerr << "Warning: " << config.input.source
                  << " is a single image; flow needs at least two frames\n";
    }

    const int output_fps = config.fps > 0
        ? config.fps
        : (source->fps() > 0.0 ? static_cast<int>(source->fps() + 0.5) : 30);

    chromaflow::FlowEstimator estimator(config.estimator_config());
    chromaflow::FlowVisualizer visualizer(config.visualizer_config());

    chromaflow::VideoEncoder video_encoder;
    bool has_video = false;
    if (!config.output.video.empty()) {
        chromaflow::VideoEncoder::Config enc_cfg;
        enc_cfg.fps = output_fps;
        enc_cfg.bitrate = config.output.bitrate;
        enc_cfg.codec = config.output.codec;
        has_video = video_encoder.open(config.output.video, enc_cfg);
        if (!has_video) {
            std::cerr << "Warning: Failed to open video output: " << config.output.video
                      << " (" << video_encoder.last_error() << ")\n";
        }
    }

    chromaflow::FlowArchiveWriter archive;
    const bool want_archive = !config.output.archive.empty();
    bool archive_failed = false;
    const std::string config_hash = config.compute_hash();

    std::signal(SIGINT, handle_sigint);

    const auto session_start = std::chrono::steady_clock::now();
    double flow_seconds = 0.0;
    double encode_seconds = 0.0;
    int frame_count = 0;
    int flow_frames = 0;

    chromaflow::FrameBuffer frame;
    while (!g_interrupted.load() && source->read(frame)) {
        if (config.input.max_frames > 0 && frame_count >= config.input.max_frames) {
            break;
        }
        const int frame_index = frame_count++;

        const auto flow_start = std::chrono::steady_clock::now();
        const chromaflow::RgbImage image =
            chromaflow::ColorSpace::to_rgb_image(frame, config.input.linearize);
        const chromaflow::Result result = estimator.push_frame(image);
        const double flow_s = seconds_since(flow_start);
        flow_seconds += flow_s;

        if (result.failure()) {
            std::cerr << "Warning: frame " << frame_index << ": " << result.message << "\n";
            continue;
        }
        if (!estimator.has_flow()) {
            continue;
        }
        ++flow_frames;

        const auto encode_start = std::chrono::steady_clock::now();
        if (has_video) {
            const chromaflow::FrameBuffer vis = visualizer.render(estimator.flow(), frame);
            if (!video_encoder.write_frame(vis)) {
                std::cerr << "Warning: Video write failed at frame " << frame_index
                          << " (" << video_encoder.last_error() << ")\n";
                has_video = false;
            }
        }
        if (want_archive && !archive_failed) {
            if (!archive.is_open() &&
                !archive.open(config.output.archive, estimator.width(), estimator.height(),
                              output_fps, config_hash, config.output.keyframe_interval)) {
                std::cerr << "Warning: Failed to open archive output: " << config.output.archive << "\n";
                archive_failed = true;
            } else if (!archive.write_frame(static_cast<uint32_t>(frame_index), estimator.flow())) {
                std::cerr << "Warning: Archive write failed at frame " << frame_index << "\n";
            }
        }
        encode_seconds += seconds_since(encode_start);

        if (config.stats) {
            const chromaflow::PixelVector mean = estimator.mean_pixel_flow();
            std::cerr << std::fixed << std::setprecision(4)
                      << "{\"frame\":" << frame_index
                      << ",\"width\":" << estimator.width()
                      << ",\"height\":" << estimator.height()
                      << ",\"levels\":" << estimator.levels_used()
                      << ",\"mean_dx\":" << mean.x
                      << ",\"mean_dy\":" << mean.y
                      << ",\"flow_ms\":" << flow_s * 1000.0
                      << "}\n";
        }
    }

    if (g_interrupted.load()) {
        std::cerr << "Warning: interrupted, finalizing outputs\n";
    }

    video_encoder.close();
    if (!video_encoder.last_error().empty() && !config.output.video.empty()) {
        std::cerr << "Warning: " << video_encoder.last_error() << "\n";
    }
    const uint32_t archived = archive.frame_count();
    archive.close();

    const double wall_seconds = seconds_since(session_start);
    if (frame_count > 0) {
        std::cerr << std::fixed << std::setprecision(2)
                  << "[PERF] frames=" << frame_count
                  << ", flow_frames=" << flow_frames
                  << ", archived=" << archived
                  << ", wall_s=" << wall_seconds
                  << ", flow_s=" << flow_seconds
                  << ", encode_s=" << encode_seconds
                  << ", flow_fps=" << (flow_seconds > 0.0 ? flow_frames / flow_seconds : 0.0)
                  << "\n";
    } else {
        std::cerr << "[PERF] no frames processed.\n";
    }

    return 0;
}
