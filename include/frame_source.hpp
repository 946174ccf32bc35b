#pragma once

#include "frame_window.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vid2slides {

struct VideoInfo {
    std::size_t total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

// Opens the video just long enough to read its properties.
// Throws AcquisitionError if it cannot be opened.
VideoInfo probe_video(const std::string& video_path);

// Lazy, finite, ordered sequence of frames.
class FrameSequence {
public:
    virtual ~FrameSequence() = default;

    // Stores the next frame in `frame` and returns true, or returns false
    // once the sequence is exhausted. May throw DecodeError.
    virtual bool next(cv::Mat& frame) = 0;

    // Source index of the frame the next call to next() would return
    virtual std::size_t position() const = 0;

    // Number of frames the sequence expects to produce, 0 if unknown
    virtual std::size_t expected_length() const = 0;
};

// Frames decoded from a video file, restricted to a frame window and
// optionally cropped. Owns the decoder handle until destruction or
// release().
class VideoFrameSource : public FrameSequence {
public:
    VideoFrameSource(const std::string& video_path,
                     const FrameIndexWindow& window,
                     const std::optional<CropRegion>& crop = std::nullopt);
    ~VideoFrameSource() override;

    VideoFrameSource(const VideoFrameSource&) = delete;
    VideoFrameSource& operator=(const VideoFrameSource&) = delete;

    bool next(cv::Mat& frame) override;
    std::size_t position() const override;
    std::size_t expected_length() const override;

    const VideoInfo& info() const;
    bool is_open() const;
    void release();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Replays frames already held in memory. Indices start at `first_index`.
class MemoryFrameSequence : public FrameSequence {
public:
    explicit MemoryFrameSequence(std::vector<cv::Mat> frames, std::size_t first_index = 0);

    bool next(cv::Mat& frame) override;
    std::size_t position() const override { return first_index_ + cursor_; }
    std::size_t expected_length() const override { return frames_.size(); }

private:
    std::vector<cv::Mat> frames_;
    std::size_t first_index_;
    std::size_t cursor_ = 0;
};

} // namespace vid2slides
