#include "cli.hpp"
#include "errors.hpp"
#include "slide_store.hpp"
#include "video_fetcher.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vid2slides {

namespace {

// Value following a flag, or a usage error if there is none
std::string require_value(int& i, int argc, char* argv[]) {
    std::string flag = argv[i];
    if (++i >= argc) {
        throw ConfigError(flag + " requires a value");
    }
    return argv[i];
}

double parse_threshold(const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid threshold: '" + text + "'");
    }
    if (consumed != text.size() || !(value >= 0.0)) {
        throw ConfigError("threshold must be a non-negative number: '" + text + "'");
    }
    return value;
}

int show_info(const ExtractionConfig& config, const std::string& locator) {
    std::string video_id = extract_video_id(locator);
    auto local = local_video_path(locator);

    std::filesystem::path video_path;
    if (local) {
        video_path = *local;
    } else {
        SlideStore store(StorageLayout{config.storage_root});
        video_path = store.video_path(video_id);
        if (!std::filesystem::exists(video_path)) {
            VideoFetcher(config.fetcher_executable).fetch(locator, video_path);
        }
    }

    auto info = probe_video(video_path.string());

    json info_json;
    info_json["video_id"] = video_id;
    info_json["video_path"] = video_path.string();
    info_json["total_frames"] = info.total_frames;
    info_json["fps"] = info.fps;
    info_json["duration"] = info.duration;
    info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
    info_json["codec"] = info.codec;

    std::cout << info_json.dump(2) << std::endl;
    return 0;
}

} // namespace

void print_usage(const char* program_name, std::ostream& out) {
    out << "Usage: " << program_name << " [OPTIONS] LOCATOR\n"
        << "Turns a recorded talk into a slide deck, one slide per distinct frame.\n"
        << "LOCATOR is a YouTube watch URL, a youtu.be link or a local video file.\n"
        << "Options:\n"
        << "  --crop x,y,w,h       Crop rectangle applied before comparison\n"
        << "  --start MM:SS        Start time (default: 00:00)\n"
        << "  --end MM:SS          End time (default: end of video)\n"
        << "  --output PATH        Deck file, or directory to put <id>.pptx in\n"
        << "  --threshold NUM      Similarity threshold (default: 200)\n"
        << "  --root DIR           Storage root for videos/ and images/ (default: .)\n"
        << "  --config FILE        JSON configuration file\n"
        << "  --summary FILE       Write the run summary as JSON\n"
        << "  --images-only        Extract slide images without building a deck\n"
        << "  --no-cache           Discard cached video and images first\n"
        << "  --info               Show video information only\n"
        << "  -q, --quiet          Suppress progress output\n"
        << "  -h, --help           Show this help\n";
}

CliOptions parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    // The config file is applied first so that flags override it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            options.config = load_config(require_value(i, argc, argv), options.config);
        }
    }

    ExtractionConfig& config = options.config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--crop") {
            config.crop = parse_crop_region(require_value(i, argc, argv));
        } else if (arg == "--start") {
            config.start = require_value(i, argc, argv);
        } else if (arg == "--end") {
            config.end = require_value(i, argc, argv);
        } else if (arg == "--output") {
            config.output = require_value(i, argc, argv);
        } else if (arg == "--threshold") {
            config.threshold = parse_threshold(require_value(i, argc, argv));
        } else if (arg == "--root") {
            config.storage_root = require_value(i, argc, argv);
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--summary") {
            options.summary_file = require_value(i, argc, argv);
        } else if (arg == "--images-only") {
            config.build_deck = false;
        } else if (arg == "--no-cache") {
            config.use_cache = false;
        } else if (arg == "--info") {
            options.info_only = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.verbose = false;
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("unknown option " + arg);
        } else if (options.locator.empty()) {
            options.locator = arg;
        } else {
            throw ConfigError("unexpected argument " + arg);
        }
    }

    if (options.locator.empty()) {
        throw ConfigError("no video locator provided");
    }
    return options;
}

int run_cli(int argc, char* argv[]) {
    const char* program_name = argc > 0 ? argv[0] : "vid2slides";
    if (argc < 2) {
        print_usage(program_name, std::cerr);
        return 1;
    }

    CliOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(program_name, std::cerr);
        return 1;
    }

    if (options.show_help) {
        print_usage(program_name, std::cout);
        return 0;
    }

    const ExtractionConfig& config = options.config;
    try {
        if (options.info_only) {
            return show_info(config, options.locator);
        }

        SlideExtractor extractor(config);
        auto result = extractor.run(options.locator);

        if (config.verbose) {
            std::cout << "Slides: " << result.images.size() << " in " << result.image_dir.string()
                      << (result.used_cache ? " (cached)" : "") << std::endl;
            std::cout << "Processing time: " << result.processing_time.count() << "ms" << std::endl;
        }
        if (result.deck_path) {
            std::cout << "PowerPoint presentation created: " << result.deck_path->string() << std::endl;
        }

        if (!options.summary_file.empty()) {
            std::ofstream file(options.summary_file);
            if (!file) {
                throw ArtifactError("cannot open " + options.summary_file + " for writing");
            }
            file << summary_json(result).dump(2);
            if (config.verbose) {
                std::cout << "Summary saved to: " << options.summary_file << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace vid2slides
