#include "frame_source.hpp"
#include "errors.hpp"
#include <opencv2/videoio.hpp>
#include <iostream>
#include <utility>

namespace vid2slides {

namespace {

VideoInfo read_info(cv::VideoCapture& cap) {
    VideoInfo info;
    double frame_count = cap.get(cv::CAP_PROP_FRAME_COUNT);
    info.total_frames = frame_count > 0 ? static_cast<std::size_t>(frame_count) : 0;
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0 ? static_cast<double>(info.total_frames) / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

} // namespace

VideoInfo probe_video(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw AcquisitionError("Cannot open video file: " + video_path);
    }
    return read_info(cap);
}

class VideoFrameSource::Impl {
public:
    Impl(const std::string& video_path, const FrameIndexWindow& window,
         const std::optional<CropRegion>& crop)
        : video_path_(video_path), window_(window), crop_(crop), position_(window.start_frame) {

        if (!cap_.open(video_path)) {
            throw AcquisitionError("Failed to open video: " + video_path);
        }
        info_ = read_info(cap_);

        if (crop_) {
            crop_->validate(info_.frame_size);
            crop_rect_ = crop_->to_rect();
        }

        if (info_.total_frames > 0 && window_.start_frame >= info_.total_frames) {
            std::cerr << "Warning: start frame " << window_.start_frame << " is past the end of "
                      << video_path_ << " (" << info_.total_frames << " frames)" << std::endl;
            exhausted_ = true;
            return;
        }

        if (window_.start_frame > 0) {
            cap_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(window_.start_frame));
        }
    }

    ~Impl() { release(); }

    bool next(cv::Mat& frame) {
        if (exhausted_ || !cap_.isOpened() || position_ >= window_.end_frame) {
            exhausted_ = true;
            return false;
        }

        cv::Mat decoded;
        bool ok = false;
        try {
            ok = cap_.read(decoded);
        } catch (const cv::Exception& e) {
            exhausted_ = true;
            throw DecodeError("frame " + std::to_string(position_) + " of " + video_path_ +
                              ": " + e.what());
        }

        if (!ok || decoded.empty()) {
            exhausted_ = true;
            return false;
        }

        if (crop_) {
            // Containers can misreport their frame size, so check what was decoded
            if (decoded.size() != info_.frame_size) {
                crop_->validate(decoded.size());
            }
            frame = decoded(crop_rect_).clone();
        } else {
            frame = std::move(decoded);
        }
        ++position_;
        return true;
    }

    void release() {
        if (cap_.isOpened()) {
            cap_.release();
        }
        exhausted_ = true;
    }

    std::size_t position() const { return position_; }
    std::size_t expected_length() const { return window_.size(); }
    const VideoInfo& info() const { return info_; }
    bool is_open() const { return cap_.isOpened(); }

private:
    std::string video_path_;
    FrameIndexWindow window_;
    std::optional<CropRegion> crop_;
    cv::Rect crop_rect_;
    cv::VideoCapture cap_;
    VideoInfo info_;
    std::size_t position_;
    bool exhausted_ = false;
};

VideoFrameSource::VideoFrameSource(const std::string& video_path,
                                   const FrameIndexWindow& window,
                                   const std::optional<CropRegion>& crop)
    : pimpl_(std::make_unique<Impl>(video_path, window, crop)) {}

VideoFrameSource::~VideoFrameSource() = default;

bool VideoFrameSource::next(cv::Mat& frame) {
    return pimpl_->next(frame);
}

std::size_t VideoFrameSource::position() const {
    return pimpl_->position();
}

std::size_t VideoFrameSource::expected_length() const {
    return pimpl_->expected_length();
}

const VideoInfo& VideoFrameSource::info() const {
    return pimpl_->info();
}

bool VideoFrameSource::is_open() const {
    return pimpl_->is_open();
}

void VideoFrameSource::release() {
    pimpl_->release();
}

MemoryFrameSequence::MemoryFrameSequence(std::vector<cv::Mat> frames, std::size_t first_index)
    : frames_(std::move(frames)), first_index_(first_index) {}

bool MemoryFrameSequence::next(cv::Mat& frame) {
    if (cursor_ >= frames_.size()) {
        return false;
    }
    frame = frames_[cursor_++];
    return true;
}

} // namespace vid2slides
