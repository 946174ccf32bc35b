#pragma once

#include "frame_selector.hpp"
#include "frame_source.hpp"
#include "frame_window.hpp"
#include "similarity.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vid2slides {

struct ExtractionConfig {
    double threshold = kDefaultThreshold;
    std::optional<CropRegion> crop;
    std::string start = "00:00";
    std::optional<std::string> end;
    bool use_cache = true;
    std::filesystem::path storage_root = ".";
    std::string output;                      // deck file or directory, empty for default
    std::string fetcher_executable = "yt-dlp";
    std::string zip_executable = "zip";
    bool build_deck = true;
    bool verbose = true;
};

// Reads a JSON config file over `base`. Keys that are absent keep their
// value in base; wrongly typed values throw ConfigError.
ExtractionConfig load_config(const std::filesystem::path& path, ExtractionConfig base = {});
ExtractionConfig config_from_json(const nlohmann::json& json, ExtractionConfig base = {});

struct ExtractionResult {
    std::string video_id;
    std::filesystem::path video_path;
    std::filesystem::path image_dir;
    std::vector<std::filesystem::path> images;
    std::vector<std::size_t> source_indices; // from manifest.json when served from cache
    std::optional<std::filesystem::path> deck_path;
    std::size_t frames_scanned = 0;
    bool used_cache = false;
    bool truncated = false;
    std::chrono::milliseconds processing_time{0};
};

nlohmann::json summary_json(const ExtractionResult& result);

class SlideExtractor {
public:
    explicit SlideExtractor(const ExtractionConfig& config = {});
    ~SlideExtractor();

    VideoInfo get_video_info(const std::string& video_path);

    // Deduplicated frames of a local video, held in memory
    std::vector<KeptFrame> extract_slides(const std::string& video_path);

    // Full pipeline: resolve the locator, fetch the video if needed,
    // extract or reuse slide images, then assemble the deck.
    ExtractionResult run(const std::string& locator);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vid2slides
