// pixunscale_command.cpp
// MIT License (c) 2026 Pedro

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
namespace fs = std::filesystem;

#include "commands/pixunscale_command.h"
#include "core/block_factor.h"
#include "core/cli_parse.h"
#include "core/frame_reducer.h"
#include "core/image_io.h"
#include "core/output_plan.h"

namespace {
using pixunscale::core::Frame;
using pixunscale::core::Image;
using pixunscale::core::OutputPlan;
using pixunscale::core::to_quoted;

constexpr unsigned int k_default_threads = 0; // Auto-detect

struct UnscaleConfig {
    fs::path input_path;
    std::optional<fs::path> output_path;
    bool in_place = false;
    bool only_analyze_first = false;
    bool analyze_only = false;
    unsigned int threads = k_default_threads;
};

class PixelArtUnscaler {
public:
    explicit PixelArtUnscaler(UnscaleConfig config) : config_(std::move(config)) {}

    bool run() {
        std::string error;
        if (!pixunscale::core::load_image_file(config_.input_path, image_, error)) {
            std::cerr << "Error: Failed to load image " << to_quoted(config_.input_path.string()) << ": " << error << '\n';
            return false;
        }

        const pixunscale::core::DetectionResult result = detect();
        if (config_.analyze_only) {
            std::cout << result.width << " x " << result.height << "\n";
            return true;
        }
        if (result.factor <= 1) {
            std::cerr << "Error: Failed to detect pixel art scaling" << '\n';
            return false;
        }

        OutputPlan plan;
        if (!pixunscale::core::plan_output(config_.output_path, config_.input_path, config_.in_place,
                                           image_.format, image_.frames.size(), plan, error)) {
            std::cerr << "Error: " << error << '\n';
            return false;
        }

        std::cout << "resizing " << image_.width() << " x " << image_.height()
                  << " -> " << result.width << " x " << result.height << "\n";

        std::vector<Frame> reduced;
        reduced.reserve(image_.frames.size());
        for (const auto& frame : image_.frames) {
            reduced.push_back(pixunscale::core::reduce_frame(frame, result.factor));
        }

        return write_output(plan, reduced);
    }

private:
    UnscaleConfig config_;
    Image image_;

    [[nodiscard]] pixunscale::core::DetectionResult detect() const {
        if (config_.only_analyze_first && image_.is_animated()) {
            const std::vector<Frame> first(image_.frames.begin(), image_.frames.begin() + 1);
            return pixunscale::core::detect(first, config_.threads);
        }
        return pixunscale::core::detect(image_.frames, config_.threads);
    }

    static bool write_output(const OutputPlan& plan, const std::vector<Frame>& reduced) {
        if (plan.first_frame_only) {
            std::cerr << "Warning: animated " << pixunscale::core::format_name(plan.format)
                      << " images are not supported, writing still image instead" << '\n';
        }
        std::string error;
        const bool ok = pixunscale::core::is_animation_format(plan.format)
            ? pixunscale::core::save_animation_file(reduced, plan.path, plan.format, error)
            : pixunscale::core::save_frame_file(reduced.front(), plan.path, plan.format, error);
        if (!ok) {
            std::cerr << "Error: Failed to write image " << to_quoted(plan.path.string()) << ": " << error << '\n';
            return false;
        }

        std::cout << "written " << to_quoted(plan.path.string()) << "\n";
        return true;
    }
};

void print_usage() {
    std::cout << "Usage: pixunscale [OPTIONS] <input> [output]\n\n"
        << "Detect the native resolution of nearest-neighbor upscaled pixel art and scale it back down.\n\n"
        << "Output:\n"
        << "  Defaults to <name>.scaled.<ext> next to the input, in the input's format.\n"
        << "  The output extension picks the format: .png .gif .jpg .bmp .tga, or .tar for\n"
        << "  an archive of PNG frames with a frames.txt delay manifest. Animations keep\n"
        << "  every frame only in .gif and .tar output.\n\n"
        << "Options:\n"
        << "  -i, --in-place            Overwrite the input file (ignored if an output is given)\n"
        << "  -f, --only-analyze-first  Only analyze the first frame of an animation. Faster, but\n"
        << "                            collapses to a tiny image if the first frame is blank\n"
        << "  -a, --analyze-only        Print the native size as \"W x H\" and write nothing\n"
        << "  -j, --threads N           Number of threads to use (default: " << k_default_threads << " = auto)\n"
        << "  -h, --help                Show this help message\n\n"
        << "Examples:\n"
        << "  pixunscale sprite_4x.png\n"
        << "  pixunscale --in-place walk.gif\n"
        << "  pixunscale --only-analyze-first walk.gif walk.tar\n"
        << "  pixunscale --analyze-only sprite_4x.png\n";
}

} // namespace

int run_pixunscale(int argc, char** argv) {
    UnscaleConfig config;
    bool show_help = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--in-place" || arg == "-i") {
            config.in_place = true;
        } else if (arg == "--only-analyze-first" || arg == "-f") {
            config.only_analyze_first = true;
        } else if (arg == "--analyze-only" || arg == "-a") {
            config.analyze_only = true;
        } else if (arg == "--threads" || arg == "-j") {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for --threads" << '\n';
                print_usage();
                return 1;
            }
            if (!pixunscale::core::parse_non_negative_uint(argv[++i], config.threads)) {
                std::cerr << "Error: Invalid threads value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }

    if (positional.empty()) {
        std::cerr << "Error: Input image path is required" << '\n';
        print_usage();
        return 1;
    }
    if (positional.size() > 2) {
        std::cerr << "Error: Too many arguments" << '\n';
        print_usage();
        return 1;
    }

    config.input_path = positional[0];
    if (positional.size() == 2) {
        config.output_path = fs::path(positional[1]);
    }

    if (!fs::exists(config.input_path) || !fs::is_regular_file(config.input_path)) {
        std::cerr << "Error: Input file does not exist or is not a file: " << to_quoted(config.input_path.string()) << '\n';
        return 1;
    }

    if (config.threads == 0) {
        config.threads = std::max(1U, std::thread::hardware_concurrency());
    }

    try {
        PixelArtUnscaler unscaler(config);
        if (!unscaler.run()) {
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
