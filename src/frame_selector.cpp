#include "frame_selector.hpp"
#include "errors.hpp"
#include "similarity.hpp"
#include <cmath>
#include <iostream>

namespace vid2slides {

FrameSelector::FrameSelector(double threshold) : threshold_(threshold) {
    if (std::isnan(threshold) || threshold < 0.0) {
        throw ConfigError("similarity threshold must be non-negative, got " +
                          std::to_string(threshold));
    }
}

bool FrameSelector::offer(const cv::Mat& frame) {
    ++frames_seen_;

    switch (state_) {
    case State::AwaitingFirst:
        reference_ = frame.clone();
        state_ = State::HaveReference;
        last_score_ = 0.0;
        ++frames_kept_;
        return true;

    case State::HaveReference:
        last_score_ = mean_squared_error(frame, reference_);
        if (last_score_ > threshold_) {
            reference_ = frame.clone();
            ++frames_kept_;
            return true;
        }
        return false;
    }
    return false;
}

void FrameSelector::reset() {
    state_ = State::AwaitingFirst;
    reference_.release();
    frames_seen_ = 0;
    frames_kept_ = 0;
    last_score_ = 0.0;
}

SelectionStats select_frames(FrameSequence& frames, double threshold,
                             const KeptFrameCallback& on_kept,
                             const ProgressCallback& on_progress) {
    FrameSelector selector(threshold);
    SelectionStats stats;
    const std::size_t total = frames.expected_length();

    cv::Mat frame;
    while (true) {
        std::size_t index = frames.position();
        try {
            if (!frames.next(frame)) {
                break;
            }
        } catch (const DecodeError& e) {
            std::cerr << "Warning: " << e.what() << "; keeping the " << stats.frames_kept
                      << " frames selected so far" << std::endl;
            stats.truncated = true;
            break;
        }

        ++stats.frames_seen;
        if (selector.offer(frame)) {
            ++stats.frames_kept;
            if (on_kept) {
                on_kept(KeptFrame{index, selector.reference()});
            }
        }

        if (on_progress) {
            on_progress(stats.frames_seen, total);
        }
    }

    return stats;
}

std::vector<KeptFrame> select_frames(FrameSequence& frames, double threshold) {
    std::vector<KeptFrame> kept;
    select_frames(frames, threshold, [&kept](const KeptFrame& k) {
        kept.push_back(k);
    });
    return kept;
}

} // namespace vid2slides
