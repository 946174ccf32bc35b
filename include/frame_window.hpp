#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace vid2slides {

// Axis-aligned rectangle in source-frame pixels.
struct CropRegion {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    cv::Rect to_rect() const { return cv::Rect(x, y, width, height); }

    // "_crop_x_y_w_h", used to name the image cache directory
    std::string signature() const;

    // Throws ConfigError unless the region lies inside frame_size
    void validate(const cv::Size& frame_size) const;

    bool operator==(const CropRegion& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// Parses "x,y,width,height". Throws ConfigError on malformed input.
CropRegion parse_crop_region(const std::string& text);

// Parses "MM:SS" into seconds. Either part may be fractional.
double parse_timestamp(const std::string& text);

struct TimeWindow {
    double start_seconds = 0.0;
    std::optional<double> end_seconds;
};

// Half-open range [start_frame, end_frame) of source frame indices.
struct FrameIndexWindow {
    // end_frame of a window over a stream of unknown length
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    std::size_t start_frame = 0;
    std::size_t end_frame = 0;

    bool bounded() const { return end_frame != kUnbounded; }

    // 0 when unbounded
    std::size_t size() const {
        return bounded() && end_frame > start_frame ? end_frame - start_frame : 0;
    }
};

TimeWindow parse_time_window(const std::string& start, const std::optional<std::string>& end);

// Resolves a time window against the source frame rate. The rate is
// truncated to an integer and an open end defaults to the source
// duration, or to kUnbounded when the source does not report its length.
// Throws ConfigError if fps is not positive, a time is out of range or the
// window is empty.
FrameIndexWindow resolve_window(const TimeWindow& window, double fps, std::size_t total_frames);

} // namespace vid2slides
