#pragma once

#include <string>
#include <vector>

namespace chromaflow {

// Parsed command line. Numeric fields hold a negative (or zero, where zero is
// not a legal value) sentinel when the option was not given, so config-file
// values survive.
struct Args {
    std::string input;
    std::string output;
    std::string archive_path;
    std::string config_path;

    int fps = 0;
    int max_frames = 0;
    int levels = 0;
    int iterations = 0;
    int window_radius = -1;
    float rotation_degrees = 45.0f;
    bool rotation_set = false;
    float confidence = -1.0f;
    float frame_blur = -1.0f;
    float flow_blur = -1.0f;
    float max_motion = -1.0f;

    bool carry_over = false;
    bool symmetric_gradient = false;
    bool linearize = false;
    bool stats = false;
    bool show_help = false;

    std::vector<std::string> errors;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
