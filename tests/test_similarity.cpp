#include <gtest/gtest.h>
#include "similarity.hpp"
#include <opencv2/opencv.hpp>
#include <stdexcept>

namespace vid2slides {

class SimilarityTest : public ::testing::Test {
protected:
    static cv::Mat solid(int value, cv::Size size = cv::Size(64, 48), int type = CV_8UC3) {
        return cv::Mat(size, type, cv::Scalar::all(value));
    }
};

TEST_F(SimilarityTest, IdenticalFramesScoreZero) {
    cv::Mat frame(120, 160, CV_8UC3);
    cv::randu(frame, cv::Scalar::all(0), cv::Scalar::all(255));

    EXPECT_DOUBLE_EQ(mean_squared_error(frame, frame), 0.0);
    EXPECT_DOUBLE_EQ(mean_squared_error(frame, frame.clone()), 0.0);
}

TEST_F(SimilarityTest, Symmetric) {
    cv::Mat a(90, 120, CV_8UC3);
    cv::Mat b(90, 120, CV_8UC3);
    cv::randu(a, cv::Scalar::all(0), cv::Scalar::all(255));
    cv::randu(b, cv::Scalar::all(0), cv::Scalar::all(255));

    EXPECT_DOUBLE_EQ(mean_squared_error(a, b), mean_squared_error(b, a));
}

TEST_F(SimilarityTest, DividesByPixelsNotChannels) {
    // A difference of 10 on every channel: 100 per channel, summed over channels
    EXPECT_DOUBLE_EQ(mean_squared_error(solid(0, {32, 32}, CV_8UC1), solid(10, {32, 32}, CV_8UC1)), 100.0);
    EXPECT_DOUBLE_EQ(mean_squared_error(solid(0), solid(10)), 300.0);
}

TEST_F(SimilarityTest, MonotonicInDifference) {
    cv::Mat base = solid(100);
    double previous = 0.0;
    for (int delta : {1, 2, 5, 10, 50, 155}) {
        double score = mean_squared_error(base, solid(100 + delta));
        EXPECT_GT(score, previous) << "delta " << delta;
        previous = score;
    }
}

TEST_F(SimilarityTest, NoOverflowOnLargeFrames) {
    cv::Mat black = solid(0, cv::Size(1920, 1080));
    cv::Mat white = solid(255, cv::Size(1920, 1080));

    EXPECT_DOUBLE_EQ(mean_squared_error(black, white), 255.0 * 255.0 * 3.0);
}

TEST_F(SimilarityTest, PartialDifferenceIsAveragedOverFrame) {
    cv::Mat a = solid(0, cv::Size(10, 10));
    cv::Mat b = a.clone();
    // One pixel out of 100 differs by 20 on each channel
    b.at<cv::Vec3b>(3, 4) = cv::Vec3b(20, 20, 20);

    EXPECT_DOUBLE_EQ(mean_squared_error(a, b), 3.0 * 400.0 / 100.0);
}

TEST_F(SimilarityTest, WorksOnNonContinuousViews) {
    cv::Mat big_a = solid(0, cv::Size(100, 100));
    cv::Mat big_b = solid(10, cv::Size(100, 100));
    cv::Mat view_a = big_a(cv::Rect(10, 10, 30, 20));
    cv::Mat view_b = big_b(cv::Rect(50, 50, 30, 20));
    ASSERT_FALSE(view_a.isContinuous());

    EXPECT_DOUBLE_EQ(mean_squared_error(view_a, view_b), 300.0);
}

TEST_F(SimilarityTest, MismatchedSizeThrows) {
    EXPECT_THROW(mean_squared_error(solid(0, {64, 48}), solid(0, {48, 64})), std::invalid_argument);
}

TEST_F(SimilarityTest, MismatchedChannelsThrows) {
    EXPECT_THROW(mean_squared_error(solid(0, {64, 48}, CV_8UC3), solid(0, {64, 48}, CV_8UC1)),
                 std::invalid_argument);
}

TEST_F(SimilarityTest, EmptyFrameThrows) {
    EXPECT_THROW(mean_squared_error(cv::Mat(), solid(0)), std::invalid_argument);
}

} // namespace vid2slides
