#include "frame_window.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace vid2slides {

namespace {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

int parse_int(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid " + what + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError("invalid " + what + ": '" + text + "'");
    }
    return value;
}

double parse_double(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid " + what + ": '" + text + "'");
    }
    if (consumed != text.size() || !std::isfinite(value)) {
        throw ConfigError("invalid " + what + ": '" + text + "'");
    }
    return value;
}

std::size_t to_frame_index(double seconds, long long rate) {
    double frame = seconds * static_cast<double>(rate);
    if (!(frame >= 0.0) || frame >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        std::ostringstream msg;
        msg << "time " << seconds << "s is out of range for a " << rate << " fps video";
        throw ConfigError(msg.str());
    }
    return static_cast<std::size_t>(frame);
}

} // namespace

std::string CropRegion::signature() const {
    std::ostringstream out;
    out << "_crop_" << x << "_" << y << "_" << width << "_" << height;
    return out.str();
}

void CropRegion::validate(const cv::Size& frame_size) const {
    // Widened so that huge origins cannot wrap around
    long long right = static_cast<long long>(x) + width;
    long long bottom = static_cast<long long>(y) + height;
    if (x < 0 || y < 0 || width <= 0 || height <= 0 ||
        right > frame_size.width || bottom > frame_size.height) {
        std::ostringstream msg;
        msg << "crop rectangle (" << x << "," << y << "," << width << "," << height
            << ") does not fit inside a " << frame_size.width << "x" << frame_size.height
            << " frame";
        throw ConfigError(msg.str());
    }
}

CropRegion parse_crop_region(const std::string& text) {
    auto parts = split(text, ',');
    if (parts.size() != 4) {
        throw ConfigError("crop must be x,y,width,height but got '" + text + "'");
    }

    CropRegion crop;
    crop.x = parse_int(parts[0], "crop x");
    crop.y = parse_int(parts[1], "crop y");
    crop.width = parse_int(parts[2], "crop width");
    crop.height = parse_int(parts[3], "crop height");

    if (crop.x < 0 || crop.y < 0 || crop.width <= 0 || crop.height <= 0) {
        throw ConfigError("crop rectangle must have a non-negative origin and positive size: '" +
                          text + "'");
    }
    return crop;
}

double parse_timestamp(const std::string& text) {
    auto parts = split(text, ':');
    if (parts.size() != 2) {
        throw ConfigError("time must be MM:SS but got '" + text + "'");
    }

    double minutes = parse_double(parts[0], "minutes in '" + text + "'");
    double seconds = parse_double(parts[1], "seconds in '" + text + "'");
    if (minutes < 0.0 || seconds < 0.0) {
        throw ConfigError("time must not be negative: '" + text + "'");
    }
    return minutes * 60.0 + seconds;
}

TimeWindow parse_time_window(const std::string& start, const std::optional<std::string>& end) {
    TimeWindow window;
    window.start_seconds = parse_timestamp(start);
    if (end) {
        window.end_seconds = parse_timestamp(*end);
    }
    return window;
}

FrameIndexWindow resolve_window(const TimeWindow& window, double fps, std::size_t total_frames) {
    auto rate = static_cast<long long>(fps);
    if (rate <= 0) {
        throw ConfigError("video reports an unusable frame rate (" + std::to_string(fps) + ")");
    }

    FrameIndexWindow resolved;
    resolved.start_frame = to_frame_index(window.start_seconds, rate);
    if (window.end_seconds) {
        resolved.end_frame = to_frame_index(*window.end_seconds, rate);
    } else if (total_frames > 0) {
        resolved.end_frame = total_frames;
    } else {
        // Unknown length: read until the decoder runs dry
        resolved.end_frame = FrameIndexWindow::kUnbounded;
    }

    if (resolved.start_frame >= resolved.end_frame) {
        std::ostringstream msg;
        msg << "time window resolves to an empty frame range [" << resolved.start_frame << ", "
            << resolved.end_frame << ")";
        throw ConfigError(msg.str());
    }
    return resolved;
}

} // namespace vid2slides
