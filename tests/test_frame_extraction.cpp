#include <gtest/gtest.h>
#include "errors.hpp"
#include "frame_selector.hpp"
#include "frame_source.hpp"
#include "slide_extractor.hpp"
#include <opencv2/opencv.hpp>
#include <cstdio>
#include <limits>
#include <random>

namespace vid2slides {

class FrameExtractionTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::string suffix = std::to_string(rd());
        video_ = "test_video_" + suffix + ".avi";
        hd_video_ = "test_video_hd_" + suffix + ".avi";

        // 50 frames at 10 fps: five slides held for ten frames each
        create_test_video(video_, 50, cv::Size(640, 480), 10);

        window_.start_frame = 0;
        window_.end_frame = 50;
    }

    void TearDown() override {
        // Clean up test video
        std::remove(video_.c_str());
        std::remove(hd_video_.c_str());
    }

    void create_test_video(const std::string& filename, int num_frames, cv::Size size, int hold) {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');

        if (!writer.open(filename, fourcc, 10.0, size)) {
            FAIL() << "Could not create test video file";
        }

        for (int i = 0; i < num_frames; ++i) {
            int slide = i / hold;
            cv::Mat frame(size, CV_8UC3, cv::Scalar(40 * slide, 255 - 40 * slide, 128));

            // A slide number block so that slides differ in structure too
            cv::rectangle(frame, cv::Point(20 + 60 * slide, 20), cv::Point(70 + 60 * slide, 70),
                          cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();
    }

    std::string video_;
    std::string hd_video_;
    FrameIndexWindow window_;
};

TEST_F(FrameExtractionTest, ProbeVideo) {
    auto info = probe_video(video_);

    EXPECT_EQ(info.total_frames, 50u);
    EXPECT_DOUBLE_EQ(info.fps, 10.0);
    EXPECT_DOUBLE_EQ(info.duration, 5.0);
    EXPECT_EQ(info.frame_size, cv::Size(640, 480));
    EXPECT_FALSE(info.codec.empty());
}

TEST_F(FrameExtractionTest, ReadsEveryFrameInOrder) {
    VideoFrameSource source(video_, window_);

    cv::Mat frame;
    std::size_t count = 0;
    while (source.next(frame)) {
        EXPECT_EQ(frame.size(), cv::Size(640, 480));
        EXPECT_EQ(frame.channels(), 3);
        ++count;
        EXPECT_EQ(source.position(), count);
    }

    EXPECT_EQ(count, 50u);
    EXPECT_FALSE(source.next(frame));
}

TEST_F(FrameExtractionTest, WindowStartsAtSeekPosition) {
    window_.start_frame = 20;
    window_.end_frame = 30;
    VideoFrameSource source(video_, window_);

    EXPECT_EQ(source.position(), 20u);
    EXPECT_EQ(source.expected_length(), 10u);

    cv::Mat frame;
    std::size_t count = 0;
    while (source.next(frame)) {
        ++count;
    }
    EXPECT_EQ(count, 10u);
    EXPECT_EQ(source.position(), 30u);
}

TEST_F(FrameExtractionTest, EndPastStreamStopsAtExhaustion) {
    window_.end_frame = 500;
    VideoFrameSource source(video_, window_);

    cv::Mat frame;
    std::size_t count = 0;
    while (source.next(frame)) {
        ++count;
    }
    EXPECT_EQ(count, 50u);
}

TEST_F(FrameExtractionTest, SeekPastEndYieldsEmptySequence) {
    window_.start_frame = 80;
    window_.end_frame = 120;

    EXPECT_NO_THROW({
        VideoFrameSource source(video_, window_);
        cv::Mat frame;
        EXPECT_FALSE(source.next(frame));
    });
}

TEST_F(FrameExtractionTest, CropAppliedToEveryFrame) {
    create_test_video(hd_video_, 6, cv::Size(1920, 1080), 2);
    window_.end_frame = 6;
    VideoFrameSource source(hd_video_, window_, CropRegion{100, 50, 400, 300});

    cv::Mat frame;
    std::size_t count = 0;
    while (source.next(frame)) {
        EXPECT_EQ(frame.rows, 300);
        EXPECT_EQ(frame.cols, 400);
        EXPECT_EQ(frame.channels(), 3);
        ++count;
    }
    EXPECT_EQ(count, 6u);
}

TEST_F(FrameExtractionTest, CropOutsideFrameIsConfigError) {
    EXPECT_THROW(VideoFrameSource source(video_, window_, CropRegion{600, 0, 100, 100}),
                 ConfigError);
    EXPECT_THROW(VideoFrameSource source(video_, window_, CropRegion{0, 400, 640, 81}),
                 ConfigError);    EXPECT_THROW(VideoFrameSource source(video_, window_,
                                         CropRegion{std::numeric_limits<int>::max(), 0, 1, 1}),
                 ConfigError);
}

TEST_F(FrameExtractionTest, UnboundedWindowReadsUntilExhaustion) {
    window_.start_frame = 10;
    window_.end_frame = FrameIndexWindow::kUnbounded;
    VideoFrameSource source(video_, window_);

    EXPECT_EQ(source.expected_length(), 0u);

    cv::Mat frame;
    std::size_t count = 0;
    while (source.next(frame)) {
        ++count;
    }
    EXPECT_EQ(count, 40u);
    EXPECT_EQ(source.position(), 50u);
}

TEST_F(FrameExtractionTest, InvalidVideoPath) {
    EXPECT_THROW(VideoFrameSource("nonexistent_video.avi", window_), AcquisitionError);
    EXPECT_THROW(probe_video("nonexistent_video.avi"), AcquisitionError);
}

TEST_F(FrameExtractionTest, ReleaseIsIdempotent) {
    VideoFrameSource source(video_, window_);
    cv::Mat frame;
    ASSERT_TRUE(source.next(frame));

    source.release();
    EXPECT_FALSE(source.is_open());
    EXPECT_FALSE(source.next(frame));
    EXPECT_NO_THROW(source.release());
}

TEST_F(FrameExtractionTest, SelectorFindsEachSlideOnce) {
    VideoFrameSource source(video_, window_);
    auto kept = select_frames(source, kDefaultThreshold);

    ASSERT_EQ(kept.size(), 5u);
    for (std::size_t i = 0; i < kept.size(); ++i) {
        EXPECT_EQ(kept[i].source_index, i * 10);
    }
}

TEST_F(FrameExtractionTest, ExtractorIntegration) {
    ExtractionConfig config;
    config.verbose = false;
    config.start = "00:02";
    config.crop = CropRegion{0, 0, 320, 240};
    SlideExtractor extractor(config);

    auto info = extractor.get_video_info(video_);
    EXPECT_EQ(info.total_frames, 50u);

    // Slides 2, 3 and 4 start inside the window at frames 20, 30, 40
    auto kept = extractor.extract_slides(video_);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].source_index, 20u);
    EXPECT_EQ(kept[1].source_index, 30u);
    EXPECT_EQ(kept[2].source_index, 40u);
    for (const auto& k : kept) {
        EXPECT_EQ(k.image.size(), cv::Size(320, 240));
    }
}

} // namespace vid2slides
