#include "slide_store.hpp"
#include "errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace vid2slides {

namespace {

constexpr const char* kManifestName = "manifest.json";

void remove_path(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw ArtifactError("cannot remove " + path.string() + ": " + ec.message());
    }
}

} // namespace

std::string slide_image_name(std::size_t sequence_number) {
    std::ostringstream name;
    name << "frame_" << std::setw(3) << std::setfill('0') << sequence_number << ".png";
    return name.str();
}

SlideWriter::SlideWriter(fs::path directory) : directory_(std::move(directory)) {}

fs::path SlideWriter::write(const KeptFrame& frame) {
    fs::path path = directory_ / slide_image_name(written_.size());

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), frame.image);
    } catch (const cv::Exception& e) {
        throw ArtifactError("failed to write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw ArtifactError("failed to write " + path.string());
    }

    written_.push_back(path);
    source_indices_.push_back(frame.source_index);
    return path;
}

SlideStore::SlideStore(StorageLayout layout) : layout_(std::move(layout)) {}

fs::path SlideStore::video_path(const std::string& video_id) const {
    return layout_.videos_dir() / (video_id + ".mp4");
}

fs::path SlideStore::image_dir(const std::string& video_id,
                               const std::optional<CropRegion>& crop) const {
    std::string name = video_id;
    if (crop) {
        name += crop->signature();
    }
    return layout_.images_dir() / name;
}

bool SlideStore::has_cached_images(const fs::path& dir) const {
    std::error_code ec;
    return fs::is_directory(dir, ec);
}

void SlideStore::purge(const std::string& video_id, const std::optional<CropRegion>& crop) const {
    remove_path(video_path(video_id));
    purge_images(video_id, crop);
}

void SlideStore::purge_images(const std::string& video_id,
                              const std::optional<CropRegion>& crop) const {
    remove_path(image_dir(video_id, crop));
}

SlideWriter SlideStore::begin(const fs::path& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ArtifactError("cannot create " + dir.string() + ": " + ec.message());
    }
    return SlideWriter(dir);
}

std::vector<fs::path> SlideStore::list_images(const fs::path& dir) const {
    std::vector<fs::path> images;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".png") {
            images.push_back(it->path());
        }
    }
    if (ec) {
        throw ArtifactError("cannot list " + dir.string() + ": " + ec.message());
    }

    std::sort(images.begin(), images.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return images;
}

void SlideStore::write_manifest(const fs::path& dir, const nlohmann::json& manifest) const {
    fs::path path = dir / kManifestName;
    std::ofstream file(path);
    if (!file) {
        throw ArtifactError("cannot open " + path.string() + " for writing");
    }
    file << manifest.dump(2);
    if (!file) {
        throw ArtifactError("failed to write " + path.string());
    }
}

std::optional<nlohmann::json> SlideStore::read_manifest(const fs::path& dir) const {
    fs::path path = dir / kManifestName;
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Warning: ignoring unreadable manifest " << path << ": " << e.what()
                  << std::endl;
        return std::nullopt;
    }
}

} // namespace vid2slides
