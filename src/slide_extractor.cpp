#include "slide_extractor.hpp"
#include "deck_writer.hpp"
#include "errors.hpp"
#include "slide_store.hpp"
#include "video_fetcher.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace vid2slides {

namespace {

template<typename T>
void read_key(const json& source, const char* key, T& target) {
    auto it = source.find(key);
    if (it == source.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("'") + key + "' has the wrong type: " + e.what());
    }
}

std::optional<CropRegion> crop_from_json(const json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return parse_crop_region(value.get<std::string>());
    }
    if (value.is_array() && value.size() == 4) {
        CropRegion crop;
        try {
            crop.x = value[0].get<int>();
            crop.y = value[1].get<int>();
            crop.width = value[2].get<int>();
            crop.height = value[3].get<int>();
        } catch (const json::type_error& e) {
            throw ConfigError(std::string("'crop' must hold integers: ") + e.what());
        }
        if (crop.x < 0 || crop.y < 0 || crop.width <= 0 || crop.height <= 0) {
            throw ConfigError("'crop' must have a non-negative origin and positive size");
        }
        return crop;
    }
    throw ConfigError("'crop' must be \"x,y,width,height\" or an array of four integers");
}

class ProgressPrinter {
public:
    explicit ProgressPrinter(bool enabled) : enabled_(enabled) {}

    void operator()(std::size_t current, std::size_t total) {
        if (!enabled_) {
            return;
        }
        if (total == 0) {
            if (current % 100 == 0) {
                std::cout << "\rProcessing video: " << current << " frames" << std::flush;
            }
            return;
        }
        int percent = static_cast<int>((current * 100) / total);
        if (percent != last_percent_ || current == total) {
            last_percent_ = percent;
            std::cout << "\rProcessing video: " << current << "/" << total
                      << " (" << percent << "%)" << std::flush;
        }
    }

    void finish() {
        if (enabled_) {
            std::cout << std::endl;
        }
    }

private:
    bool enabled_;
    int last_percent_ = -1;
};

} // namespace

ExtractionConfig config_from_json(const json& source, ExtractionConfig base) {
    if (!source.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    read_key(source, "threshold", base.threshold);
    read_key(source, "start", base.start);
    read_key(source, "use_cache", base.use_cache);
    read_key(source, "output", base.output);
    read_key(source, "fetcher", base.fetcher_executable);
    read_key(source, "zip", base.zip_executable);
    read_key(source, "build_deck", base.build_deck);
    read_key(source, "verbose", base.verbose);

    std::string root;
    read_key(source, "storage_root", root);
    if (!root.empty()) {
        base.storage_root = root;
    }

    std::string end;
    read_key(source, "end", end);
    if (!end.empty()) {
        base.end = end;
    }

    auto crop = source.find("crop");
    if (crop != source.end()) {
        base.crop = crop_from_json(*crop);
    }

    if (std::isnan(base.threshold) || base.threshold < 0.0) {
        throw ConfigError("'threshold' must be non-negative");
    }
    return base;
}

ExtractionConfig load_config(const fs::path& path, ExtractionConfig base) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file " + path.string());
    }

    json source;
    try {
        source = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path.string() + ": " + e.what());
    }
    return config_from_json(source, std::move(base));
}

json summary_json(const ExtractionResult& result) {
    json summary;
    summary["video_id"] = result.video_id;
    summary["video_path"] = result.video_path.string();
    summary["image_dir"] = result.image_dir.string();

    json images = json::array();
    for (const auto& image : result.images) {
        images.push_back(image.string());
    }
    summary["images"] = images;
    summary["slide_count"] = result.images.size();
    summary["source_frames"] = result.source_indices;
    summary["deck_path"] = result.deck_path ? json(result.deck_path->string()) : json(nullptr);
    summary["frames_scanned"] = result.frames_scanned;
    summary["used_cache"] = result.used_cache;
    summary["truncated"] = result.truncated;
    summary["processing_time_ms"] = result.processing_time.count();
    return summary;
}

class SlideExtractor::Impl {
public:
    explicit Impl(const ExtractionConfig& config)
        : config_(config)
        , store_(StorageLayout{config.storage_root})
        , fetcher_(config.fetcher_executable)
        , deck_writer_(std::make_unique<PptxDeckWriter>(config.zip_executable)) {

        if (std::isnan(config_.threshold) || config_.threshold < 0.0) {
            throw ConfigError("similarity threshold must be non-negative");
        }
        window_ = parse_time_window(config_.start, config_.end);

        if (config_.verbose) {
            std::cout << "SlideExtractor initialized with:" << std::endl;
            std::cout << "  Threshold: " << config_.threshold << std::endl;
            std::cout << "  Crop: " << (config_.crop ? config_.crop->signature().substr(6) : "none")
                      << std::endl;
            std::cout << "  Window: " << config_.start << " - " << config_.end.value_or("end")
                      << std::endl;
            std::cout << "  Storage root: " << config_.storage_root.string() << std::endl;
        }
    }

    VideoInfo get_video_info(const std::string& video_path) {
        return probe_video(video_path);
    }

    std::vector<KeptFrame> extract_slides(const std::string& video_path) {
        std::vector<KeptFrame> kept;
        scan(video_path, [&kept](const KeptFrame& frame) {
            kept.push_back(frame);
        });
        return kept;
    }

    ExtractionResult run(const std::string& locator) {
        auto start_time = std::chrono::high_resolution_clock::now();

        ExtractionResult result;
        result.video_id = extract_video_id(locator);
        auto local = local_video_path(locator);
        result.video_path = local ? *local : store_.video_path(result.video_id);
        result.image_dir = store_.image_dir(result.video_id, config_.crop);

        log() << "Processing video: " << result.video_path.string() << std::endl;

        if (!config_.use_cache) {
            // Never delete a video the caller pointed at directly
            if (local) {
                store_.purge_images(result.video_id, config_.crop);
            } else {
                store_.purge(result.video_id, config_.crop);
            }
        }

        std::error_code ec;
        if (!fs::exists(result.video_path, ec)) {
            fetcher_.fetch(locator, result.video_path);
        }

        if (store_.has_cached_images(result.image_dir)) {
            log() << "Using cached images..." << std::endl;
            result.used_cache = true;
            result.images = store_.list_images(result.image_dir);
            if (auto manifest = store_.read_manifest(result.image_dir)) {
                read_key(*manifest, "source_frames", result.source_indices);
            }
        } else {
            extract_to_store(result);
        }

        if (result.images.empty()) {
            std::cerr << "Warning: no frames were extracted from " << result.video_path.string()
                      << "; no deck written" << std::endl;
        } else if (config_.build_deck) {
            fs::path deck = resolve_deck_path(config_.output, result.image_dir, result.video_id,
                                              deck_writer_->extension());
            log() << "Creating presentation from " << result.images.size() << " images" << std::endl;
            result.deck_path = deck_writer_->write(result.images, deck, result.video_id);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        return result;
    }

private:
    std::ostream& log() {
        return config_.verbose ? std::cout : null_stream_;
    }

    SelectionStats scan(const std::string& video_path, const KeptFrameCallback& on_kept) {
        VideoInfo info = probe_video(video_path);
        FrameIndexWindow frames = resolve_window(window_, info.fps, info.total_frames);

        if (frames.bounded()) {
            log() << "Scanning frames [" << frames.start_frame << ", " << frames.end_frame << ") of "
                  << info.total_frames << " at " << info.fps << " fps" << std::endl;
        } else {
            log() << "Scanning from frame " << frames.start_frame << " to the end of the stream at "
                  << info.fps << " fps (length not reported)" << std::endl;
        }

        VideoFrameSource source(video_path, frames, config_.crop);
        ProgressPrinter progress(config_.verbose);
        SelectionStats stats = select_frames(source, config_.threshold, on_kept,
            [&progress](std::size_t current, std::size_t total) {
                progress(current, total);
            });
        progress.finish();
        source.release();

        log() << "Kept " << stats.frames_kept << " of " << stats.frames_seen << " frames"
              << (stats.truncated ? " (stream ended early)" : "") << std::endl;
        return stats;
    }

    void extract_to_store(ExtractionResult& result) {
        SlideWriter writer = store_.begin(result.image_dir);
        try {
            SelectionStats stats = scan(result.video_path.string(), [&writer](const KeptFrame& frame) {
                writer.write(frame);
            });
            result.frames_scanned = stats.frames_seen;
            result.truncated = stats.truncated;
            result.images = writer.written();
            result.source_indices = writer.source_indices();

            if (result.images.empty()) {
                store_.purge_images(result.video_id, config_.crop);
                return;
            }

            json manifest;
            manifest["video_id"] = result.video_id;
            manifest["threshold"] = config_.threshold;
            manifest["crop"] = config_.crop ? json::array({config_.crop->x, config_.crop->y,
                                                           config_.crop->width, config_.crop->height})
                                            : json(nullptr);
            manifest["start"] = config_.start;
            manifest["end"] = config_.end ? json(*config_.end) : json(nullptr);
            manifest["source_frames"] = result.source_indices;
            manifest["frames_scanned"] = result.frames_scanned;
            manifest["truncated"] = result.truncated;
            store_.write_manifest(result.image_dir, manifest);
        } catch (const std::exception&) {
            // A half-written directory would be mistaken for a cache hit
            std::error_code ec;
            fs::remove_all(result.image_dir, ec);
            throw;
        }
    }

    ExtractionConfig config_;
    TimeWindow window_;
    SlideStore store_;
    VideoFetcher fetcher_;
    std::unique_ptr<DeckWriter> deck_writer_;
    std::ostream null_stream_{nullptr};
};

SlideExtractor::SlideExtractor(const ExtractionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

SlideExtractor::~SlideExtractor() = default;

VideoInfo SlideExtractor::get_video_info(const std::string& video_path) {
    return pimpl_->get_video_info(video_path);
}

std::vector<KeptFrame> SlideExtractor::extract_slides(const std::string& video_path) {
    return pimpl_->extract_slides(video_path);
}

ExtractionResult SlideExtractor::run(const std::string& locator) {
    return pimpl_->run(locator);
}

} // namespace vid2slides
