#pragma once

#include "frame_source.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace vid2slides {

struct KeptFrame {
    std::size_t source_index = 0;
    cv::Mat image;
};

struct SelectionStats {
    std::size_t frames_seen = 0;
    std::size_t frames_kept = 0;
    bool truncated = false; // stream ended on a decode fault
};

using KeptFrameCallback = std::function<void(const KeptFrame&)>;
using ProgressCallback = std::function<void(std::size_t current, std::size_t total)>;

// Greedy streaming deduplication. Each candidate is compared with the
// last *kept* frame; it is kept, and becomes the new reference, only if
// mean_squared_error(candidate, reference) > threshold.
class FrameSelector {
public:
    enum class State {
        AwaitingFirst,
        HaveReference
    };

    explicit FrameSelector(double threshold);

    // Returns true if the frame was kept
    bool offer(const cv::Mat& frame);

    void reset();

    State state() const { return state_; }
    double threshold() const { return threshold_; }
    const cv::Mat& reference() const { return reference_; }
    std::size_t frames_seen() const { return frames_seen_; }
    std::size_t frames_kept() const { return frames_kept_; }
    double last_score() const { return last_score_; }

private:
    double threshold_;
    State state_ = State::AwaitingFirst;
    cv::Mat reference_;
    std::size_t frames_seen_ = 0;
    std::size_t frames_kept_ = 0;
    double last_score_ = 0.0;
};

// Runs a FrameSelector over the whole sequence, handing every kept frame
// to on_kept in order. A DecodeError from the sequence ends the run early
// with stats.truncated set; it is not rethrown. Anything else propagates.
SelectionStats select_frames(FrameSequence& frames, double threshold,
                             const KeptFrameCallback& on_kept,
                             const ProgressCallback& on_progress = {});

std::vector<KeptFrame> select_frames(FrameSequence& frames, double threshold);

} // namespace vid2slides
