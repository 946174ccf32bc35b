#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace vid2slides {

// Identity of the video behind a locator. Throws ConfigError if none can
// be resolved: the `v=` query value of a watch URL, the path of a
// youtu.be short link, or the stem of an existing local file.
std::string extract_video_id(const std::string& locator);

// Set when the locator names a video already on disk
std::optional<std::filesystem::path> local_video_path(const std::string& locator);

// Downloads a remote video with an external downloader (yt-dlp by default).
class VideoFetcher {
public:
    explicit VideoFetcher(std::string executable = "yt-dlp");

    // Writes the highest resolution mp4 stream of `url` to `destination`.
    // Throws AcquisitionError on failure.
    std::filesystem::path fetch(const std::string& url,
                                const std::filesystem::path& destination) const;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

} // namespace vid2slides
