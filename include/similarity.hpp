#pragma once

#include <opencv2/core.hpp>

namespace vid2slides {

// Default threshold for mean_squared_error below which two frames count
// as the same slide.
constexpr double kDefaultThreshold = 200.0;

// Sum of squared per-channel differences divided by rows * cols.
// The channel count is not part of the divisor: a 3-channel frame scores
// three times a single-channel frame with the same per-channel error.
//
// Throws std::invalid_argument if a and b differ in size, depth or
// channel count.
double mean_squared_error(const cv::Mat& a, const cv::Mat& b);

} // namespace vid2slides
