#pragma once

#include "frame_selector.hpp"
#include "frame_window.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vid2slides {

// Where downloaded videos and extracted images live.
struct StorageLayout {
    std::filesystem::path root = ".";

    std::filesystem::path videos_dir() const { return root / "videos"; }
    std::filesystem::path images_dir() const { return root / "images"; }
};

// File name for the n-th kept frame: frame_000.png, frame_001.png, ...
std::string slide_image_name(std::size_t sequence_number);

// Persists kept frames one at a time, in order.
class SlideWriter {
public:
    explicit SlideWriter(std::filesystem::path directory);

    // Throws ArtifactError if the image cannot be written
    std::filesystem::path write(const KeptFrame& frame);

    const std::filesystem::path& directory() const { return directory_; }
    const std::vector<std::filesystem::path>& written() const { return written_; }
    const std::vector<std::size_t>& source_indices() const { return source_indices_; }

private:
    std::filesystem::path directory_;
    std::vector<std::filesystem::path> written_;
    std::vector<std::size_t> source_indices_;
};

class SlideStore {
public:
    explicit SlideStore(StorageLayout layout = {});

    const StorageLayout& layout() const { return layout_; }

    std::filesystem::path video_path(const std::string& video_id) const;
    std::filesystem::path image_dir(const std::string& video_id,
                                    const std::optional<CropRegion>& crop) const;

    bool has_cached_images(const std::filesystem::path& dir) const;

    // Removes the stored video and the image directory for this
    // (video, crop) pair. Missing entries are not an error.
    void purge(const std::string& video_id, const std::optional<CropRegion>& crop) const;
    void purge_images(const std::string& video_id, const std::optional<CropRegion>& crop) const;

    // Creates the directory and returns a writer for it
    SlideWriter begin(const std::filesystem::path& dir) const;

    // .png files in dir, sorted by name
    std::vector<std::filesystem::path> list_images(const std::filesystem::path& dir) const;

    void write_manifest(const std::filesystem::path& dir, const nlohmann::json& manifest) const;
    std::optional<nlohmann::json> read_manifest(const std::filesystem::path& dir) const;

private:
    StorageLayout layout_;
};

} // namespace vid2slides
