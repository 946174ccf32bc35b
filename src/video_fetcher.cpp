#include "video_fetcher.hpp"
#include "errors.hpp"
#include "process.hpp"
#include <iostream>
#include <regex>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace vid2slides {

std::optional<fs::path> local_video_path(const std::string& locator) {
    if (locator.find("://") != std::string::npos) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path path(locator);
    if (fs::is_regular_file(path, ec)) {
        return path;
    }
    return std::nullopt;
}

std::string extract_video_id(const std::string& locator) {
    static const std::regex watch_param(R"(v=([^&]+))");
    static const std::regex short_link(R"(youtu\.be/([^?&/]+))");

    if (auto local = local_video_path(locator)) {
        std::string stem = local->stem().string();
        if (!stem.empty()) {
            return stem;
        }
    }

    std::smatch match;
    if (std::regex_search(locator, match, watch_param)) {
        return match[1].str();
    }
    if (std::regex_search(locator, match, short_link)) {
        return match[1].str();
    }
    throw ConfigError("Could not extract video ID from URL: " + locator);
}

VideoFetcher::VideoFetcher(std::string executable) : executable_(std::move(executable)) {}

fs::path VideoFetcher::fetch(const std::string& url, const fs::path& destination) const {
    if (!command_available(executable_)) {
        throw AcquisitionError("'" + executable_ + "' was not found on PATH; it is needed to download " + url);
    }

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        throw AcquisitionError("cannot create " + destination.parent_path().string() + ": " +
                               ec.message());
    }

    std::string command = shell_quote(executable_) +
                          " --no-playlist --quiet -f " + shell_quote("best[ext=mp4]/mp4") +
                          " -o " + shell_quote(destination.string()) + " " + shell_quote(url);

    std::cout << "Downloading " << url << " to " << destination.string() << std::endl;
    CommandResult result;
    try {
        result = run_command(command);
    } catch (const std::runtime_error& e) {
        throw AcquisitionError(e.what());
    }

    if (result.exit_code != 0) {
        fs::remove(destination, ec);
        throw AcquisitionError("download of " + url + " failed with status " +
                               std::to_string(result.exit_code) + ": " + result.output);
    }
    if (!fs::is_regular_file(destination, ec)) {
        throw AcquisitionError("downloader reported success but " + destination.string() +
                               " does not exist");
    }
    return destination;
}

} // namespace vid2slides
