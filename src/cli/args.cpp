#include "cli/args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cerrno>

namespace chromaflow {

static bool parse_int(const char* s, int min_val, int max_val, int& out) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < min_val || v > max_val) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_float(const char* s, float min_val, float max_val, float& out) {
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(s, &end);
    if (errno != 0 || end == s || *end != '\0' || !(v >= min_val && v <= max_val)) return false;
    out = v;
    return true;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto next_value = [&](int& i, const char* name) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.errors.push_back(std::string("missing value for ") + name);
        return nullptr;
    };
    auto take_int = [&](int& i, const char* name, int lo, int hi, int& out) {
        if (const char* v = next_value(i, name)) {
            if (!parse_int(v, lo, hi, out)) {
                args.errors.push_back(std::string(name) + " expects an integer in [" +
                                      std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + v + "'");
            }
        }
    };
    auto take_float = [&](int& i, const char* name, float lo, float hi, float& out) -> bool {
        if (const char* v = next_value(i, name)) {
            if (parse_float(v, lo, hi, out)) return true;
            args.errors.push_back(std::string(name) + " expects a number in [" +
                                  std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + v + "'");
        }
        return false;
    };
    auto take_path = [&](int& i, const char* name, std::string& out) {
        if (const char* v = next_value(i, name)) {
            out = v;
            if (!validate_path(out)) {
                args.errors.push_back(std::string("invalid path for ") + name);
                out.clear();
            }
        }
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            take_path(i, "--output", args.output);
        }
        else if (strcmp(arg, "--archive") == 0) {
            take_path(i, "--archive", args.archive_path);
        }
        else if (strcmp(arg, "--config") == 0) {
            take_path(i, "--config", args.config_path);
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            take_int(i, "--fps", 1, 240, args.fps);
        }
        else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--frames") == 0) {
            take_int(i, "--frames", 1, 1000000, args.max_frames);
        }
        else if (strcmp(arg, "--levels") == 0) {
            take_int(i, "--levels", 1, 12, args.levels);
        }
        else if (strcmp(arg, "--iterations") == 0) {
            take_int(i, "--iterations", 1, 16, args.iterations);
        }
        else if (strcmp(arg, "--window-radius") == 0) {
            take_int(i, "--window-radius", 0, 8, args.window_radius);
        }
        else if (strcmp(arg, "--rotation") == 0) {
            args.rotation_set = take_float(i, "--rotation", -360.0f, 360.0f, args.rotation_degrees);
        }
        else if (strcmp(arg, "--confidence") == 0) {
            take_float(i, "--confidence", 0.0f, 100.0f, args.confidence);
        }
        else if (strcmp(arg, "--frame-blur") == 0) {
            take_float(i, "--frame-blur", 0.0f, 10.0f, args.frame_blur);
        }
        else if (strcmp(arg, "--flow-blur") == 0) {
            take_float(i, "--flow-blur", 0.0f, 10.0f, args.flow_blur);
        }
        else if (strcmp(arg, "--max-motion") == 0) {
            take_float(i, "--max-motion", 0.0f, 10000.0f, args.max_motion);
        }
        else if (strcmp(arg, "--carry") == 0) {
            args.carry_over = true;
        }
        else if (strcmp(arg, "--symmetric") == 0) {
            args.symmetric_gradient = true;
        }
        else if (strcmp(arg, "--linearize") == 0) {
            args.linearize = true;
        }
        else if (strcmp(arg, "--stats") == 0) {
            args.stats = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.errors.push_back(std::string("unknown option ") + arg);
        }
        else {
            if (!args.input.empty()) {
                args.errors.push_back("more than one input given");
            }
            args.input = arg;
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT>\n\n", prog);
    printf("Dense optical flow over a video using photometric color invariants.\n\n");
    printf("INPUT:\n");
    printf("  Video file, still image, image sequence (frames/*.png, img_%%04d.png)\n");
    printf("  or raw frames on stdin (pipe:WxH[:rgb|rgba[:fps]])\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --output <FILE>       Write HSV flow visualization (.mp4 or .gif)\n");
    printf("      --archive <FILE>      Write encoded flow fields to a .cflow archive\n");
    printf("      --config <FILE>       Config file path (default: ~/.config/chromaflow/config.toml)\n");
    printf("  -f, --fps <N>             Output frame rate (default: source rate)\n");
    printf("  -n, --frames <N>          Stop after N input frames\n");
    printf("      --levels <N>          Pyramid levels (default: 4, range: 1-12)\n");
    printf("      --iterations <N>      Refinement passes per level (default: 1)\n");
    printf("      --window-radius <N>   Window radius; 1 is a 3x3 window (default: 1)\n");
    printf("      --rotation <DEG>      Window rotation in degrees (default: 45)\n");
    printf("      --confidence <N>      Minimum SSD/gradient energy ratio (default: 0.1)\n");
    printf("      --symmetric           Average spatial gradients of both frames\n");
    printf("      --frame-blur <SIGMA>  Gaussian blur of each pyramid level (default: 1.0)\n");
    printf("      --flow-blur <SIGMA>   Gaussian blur of the flow after each level (default: 1.0)\n");
    printf("      --carry               Seed each frame with the previous frame's flow\n");
    printf("      --linearize           Decode sRGB to linear light before estimation\n");
    printf("      --max-motion <PX>     Motion shown at full brightness (default: per-frame max)\n");
    printf("      --stats               Per-frame statistics as JSONL on stderr\n");
    printf("  -h, --help                Show this help\n");
}

}
