#include <opencv2/opencv.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "batch.hpp"
#include "colorizer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "pipeline.hpp"

static std::atomic<bool> g_cancel{false};

static void onSignal(int) {
    g_cancel = true;
}

static void usage() {
    std::cout
        << "Usage:\n"
        << "  ./colorize_video --input <video>... | --input-dir <dir> [--recursive]\n"
        << "                   [--output-dir <dir>] [--config <file.yml>]\n"
        << "                   [--render-factor N] [--saturation-scale F]\n"
        << "                   [--clahe-clip-limit F] [--blend-factor F]\n"
        << "                   [--tile-grid WxH] [--match-reference processed|raw]\n"
        << "                   [--codec FOURCC] [--workers N]\n"
        << "                   [--model <prototxt> <caffemodel> <pts_in_hull.yml>]\n"
        << "                   [--colorized] [--save-config <file.yml>] [--verbose]\n"
        << "  ./colorize_video --image <colorized_image> [--reference <image>] [--output-dir <dir>]\n";
}

struct Args {
    std::vector<std::string> inputs;
    std::string inputDir;
    bool recursive = false;
    std::string outputDir = "colorized_videos";

    std::string configPath;
    std::string saveConfigPath;
    DnnModelPaths model;
    bool colorized = false;
    bool verbose = false;

    std::string image;
    std::string reference;
};

static bool isOption(const std::string& s) {
    return s.size() > 2 && s.compare(0, 2, "--") == 0;
}

// command-line values are applied after the config file
static bool parseArgs(int argc, char** argv, Args& args, PipelineConfig& cfg) {
    std::vector<std::string> a(argv + 1, argv + argc);

    // config file first so flags override it
    for (size_t i = 0; i + 1 < a.size(); i++) {
        if (a[i] == "--config") {
            args.configPath = a[i + 1];
            if (!loadConfig(args.configPath, cfg)) {
                std::cerr << "Could not read config file: " << args.configPath << "\n";
                return false;
            }
        }
    }

    for (size_t i = 0; i < a.size(); i++) {
        const std::string& cmd = a[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= a.size()) throw std::invalid_argument(cmd + " needs a value");
            return a[++i];
        };

        if (cmd == "--input") {
            while (i + 1 < a.size() && !isOption(a[i + 1])) args.inputs.push_back(a[++i]);
        } else if (cmd == "--input-dir") {
            args.inputDir = value();
        } else if (cmd == "--recursive") {
            args.recursive = true;
        } else if (cmd == "--output-dir") {
            args.outputDir = value();
        } else if (cmd == "--config") {
            value();
        } else if (cmd == "--save-config") {
            args.saveConfigPath = value();
        } else if (cmd == "--render-factor") {
            cfg.renderFactor = std::stoi(value());
        } else if (cmd == "--saturation-scale") {
            cfg.saturationScale = std::stod(value());
        } else if (cmd == "--clahe-clip-limit") {
            cfg.claheClipLimit = std::stod(value());
        } else if (cmd == "--blend-factor") {
            cfg.blendFactor = std::stod(value());
        } else if (cmd == "--tile-grid") {
            std::string v = value();
            size_t x = v.find('x');
            if (x == std::string::npos) throw std::invalid_argument("--tile-grid expects WxH");
            cfg.tileGridSize = cv::Size(std::stoi(v.substr(0, x)), std::stoi(v.substr(x + 1)));
        } else if (cmd == "--match-reference") {
            std::string v = value();
            if (!parseMatchReference(v, cfg.matchReference))
                throw std::invalid_argument("--match-reference expects processed or raw");
        } else if (cmd == "--codec") {
            cfg.codec = value();
        } else if (cmd == "--workers") {
            cfg.workers = std::stoi(value());
        } else if (cmd == "--model") {
            args.model.prototxt = value();
            args.model.caffemodel = value();
            args.model.hullPoints = value();
        } else if (cmd == "--colorized") {
            args.colorized = true;
        } else if (cmd == "--verbose") {
            args.verbose = true;
        } else if (cmd == "--image") {
            args.image = value();
        } else if (cmd == "--reference") {
            args.reference = value();
        } else {
            std::cerr << "Unknown option: " << cmd << "\n";
            return false;
        }
    }

    int modes = (!args.inputs.empty()) + (!args.inputDir.empty()) + (!args.image.empty());
    if (modes != 1) {
        std::cerr << "Exactly one of --input, --input-dir or --image is required.\n";
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// IMAGE MODE
// ------------------------------------------------------------
static int runImage(const Args& args, const PipelineConfig& cfg) {
    cv::Mat img = cv::imread(args.image, cv::IMREAD_COLOR);
    if (img.empty()) {
        std::cerr << "Could not read image: " << args.image << "\n";
        return 1;
    }

    PipelineState state;
    if (!args.reference.empty()) {
        cv::Mat ref = cv::imread(args.reference, cv::IMREAD_COLOR);
        if (ref.empty()) {
            std::cerr << "Could not read reference image: " << args.reference << "\n";
            return 1;
        }
        state.matcher.referenceFrame = ref;
    }

    std::string base = std::filesystem::path(args.image).stem().string();
    state.debugDir = args.outputDir + "/images/" + base;

    processFrame(img, cfg, state);
    std::cout << "Saved stages to " << state.debugDir << "\n";
    return 0;
}

// ------------------------------------------------------------
// VIDEO MODE
// ------------------------------------------------------------
static int runVideos(const Args& args, const PipelineConfig& cfg) {
    bool haveModel = !args.model.prototxt.empty();
    if (!haveModel && !args.colorized) {
        std::cerr << "Either --model or --colorized is required to process videos.\n";
        return 2;
    }
    if (haveModel) {
        for (const auto& p : {args.model.prototxt, args.model.caffemodel, args.model.hullPoints}) {
            if (!std::filesystem::exists(p)) {
                std::cerr << "Model file not found: " << p << "\n";
                return 2;
            }
        }
    }

    std::vector<std::string> inputs = args.inputs;
    if (!args.inputDir.empty()) {
        if (!std::filesystem::is_directory(args.inputDir)) {
            std::cerr << "Not a directory: " << args.inputDir << "\n";
            return 2;
        }
        inputs = discoverVideos(args.inputDir, args.recursive);
    }
    if (inputs.empty()) {
        std::cout << "No input videos found.\n";
        return 0;
    }

    const int fourcc = codecFourcc(cfg.codec);

    BatchOptions opts;
    opts.outputDir = args.outputDir;
    opts.cancel = &g_cancel;

    opts.makeSource = [&](const VideoJob& job) -> std::unique_ptr<FrameSource> {
        auto decoder = std::make_unique<VideoFileSource>(job.inputPath);

        std::unique_ptr<Colorizer> colorizer;
        if (args.colorized) {
            colorizer = std::make_unique<IdentityColorizer>();
        } else {
            auto dnn = std::make_unique<DnnColorizer>();
            if (!dnn->load(args.model))
                throw PipelineError(ErrorKind::ModelFailure,
                                    "could not load model " + args.model.caffemodel);
            colorizer = std::move(dnn);
        }
        return std::make_unique<ColorizingSource>(std::move(decoder), std::move(colorizer),
                                                  cfg.renderFactor);
    };

    opts.makeSink = [fourcc](const std::string& path, const VideoInfo& info)
            -> std::unique_ptr<FrameSink> {
        return std::make_unique<VideoFileSink>(path, fourcc, info.fps);
    };

    BatchSummary summary = runBatch(inputs, cfg, opts);

    for (const auto& job : summary.jobs) {
        std::cout << jobStatusName(job.status) << "  " << job.inputPath;
        if (job.skipped) std::cout << "  (already done)";
        if (!job.errorMessage.empty()) std::cout << "  " << job.errorMessage;
        std::cout << "\n";
    }
    return summary.failed == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }

    Args args;
    PipelineConfig cfg;
    try {
        if (!parseArgs(argc, argv, args, cfg)) {
            usage();
            return 2;
        }
        validateConfig(cfg);
    } catch (const PipelineError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        // std::stoi / std::stod and missing option values
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        usage();
        return 2;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    if (!args.saveConfigPath.empty() && !saveConfig(args.saveConfigPath, cfg)) {
        std::cerr << "Failed to save config file: " << args.saveConfigPath << "\n";
        return 2;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        if (!args.image.empty()) return runImage(args, cfg);
        return runVideos(args, cfg);
    } catch (const PipelineError& e) {
        std::cerr << e.what() << "\n";
        return e.kind() == ErrorKind::ConfigError ? 2 : 1;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
