#include <gtest/gtest.h>
#include "errors.hpp"
#include "process.hpp"
#include "slide_extractor.hpp"
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <random>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace vid2slides {

class VideoProcessingTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("vid2slides_run_" + std::to_string(rd()));
        fs::create_directories(root_);

        video_ = root_ / "lecture.avi";
        create_test_video(video_.string(), 40, cv::Size(320, 240));

        // Default configuration
        config_.storage_root = root_ / "store";
        config_.build_deck = false;
        config_.verbose = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    // Four slides held for ten frames each at 10 fps
    void create_test_video(const std::string& filename, int num_frames, cv::Size size) {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');

        if (!writer.open(filename, fourcc, 10.0, size)) {
            FAIL() << "Could not create test video: " << filename;
        }

        for (int i = 0; i < num_frames; ++i) {
            int slide = i / 10;
            cv::Mat frame(size, CV_8UC3, cv::Scalar(60 * slide, 200 - 40 * slide, 100));
            cv::putText(frame, std::to_string(slide), cv::Point(10, 30),
                        cv::FONT_HERSHEY_SIMPLEX, 1, cv::Scalar(255, 255, 255), 2);
            writer << frame;
        }
        writer.release();
    }

    // name -> (size, mtime) for every file in dir
    static std::map<std::string, std::pair<std::uintmax_t, fs::file_time_type>> listing(const fs::path& dir) {
        std::map<std::string, std::pair<std::uintmax_t, fs::file_time_type>> files;
        for (const auto& entry : fs::directory_iterator(dir)) {
            files[entry.path().filename().string()] = {entry.file_size(), entry.last_write_time()};
        }
        return files;
    }

    fs::path root_;
    fs::path video_;
    ExtractionConfig config_;
};

TEST_F(VideoProcessingTest, ExtractsOneImagePerSlide) {
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    EXPECT_EQ(result.video_id, "lecture");
    EXPECT_EQ(result.video_path, video_);
    EXPECT_EQ(result.image_dir, config_.storage_root / "images" / "lecture");
    EXPECT_FALSE(result.used_cache);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.frames_scanned, 40u);
    EXPECT_EQ(result.source_indices, (std::vector<std::size_t>{0, 10, 20, 30}));
    EXPECT_FALSE(result.deck_path.has_value());

    ASSERT_EQ(result.images.size(), 4u);
    for (std::size_t i = 0; i < result.images.size(); ++i) {
        EXPECT_EQ(result.images[i].filename().string(), "frame_00" + std::to_string(i) + ".png");
        EXPECT_TRUE(fs::is_regular_file(result.images[i]));
    }
    EXPECT_TRUE(fs::exists(result.image_dir / "manifest.json"));
}

TEST_F(VideoProcessingTest, CachedRerunLeavesImagesUntouched) {
    SlideExtractor first(config_);
    auto initial = first.run(video_.string());
    auto before = listing(initial.image_dir);

    SlideExtractor second(config_);
    auto rerun = second.run(video_.string());

    EXPECT_TRUE(rerun.used_cache);
    EXPECT_EQ(rerun.images, initial.images);
    EXPECT_EQ(rerun.source_indices, initial.source_indices);
    EXPECT_EQ(listing(rerun.image_dir), before);
}

TEST_F(VideoProcessingTest, NoCacheRegeneratesImages) {
    SlideExtractor first(config_);
    auto initial = first.run(video_.string());
    // A stale leftover that a fresh extraction must not keep
    std::ofstream(initial.image_dir / "frame_999.png") << "stale";

    config_.use_cache = false;
    SlideExtractor second(config_);
    auto rerun = second.run(video_.string());

    EXPECT_FALSE(rerun.used_cache);
    EXPECT_EQ(rerun.images.size(), 4u);
    EXPECT_FALSE(fs::exists(initial.image_dir / "frame_999.png"));
    // The caller's own video file is never purged
    EXPECT_TRUE(fs::exists(video_));
}

TEST_F(VideoProcessingTest, CropSelectsSeparateCacheEntry) {
    config_.crop = CropRegion{0, 0, 160, 120};
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    EXPECT_EQ(result.image_dir, config_.storage_root / "images" / "lecture_crop_0_0_160_120");
    ASSERT_FALSE(result.images.empty());
    cv::Mat slide = cv::imread(result.images[0].string());
    EXPECT_EQ(slide.size(), cv::Size(160, 120));
}

TEST_F(VideoProcessingTest, TimeWindowLimitsScan) {
    config_.start = "00:01.5";
    config_.end = "00:03";
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    // Frames 15..29 cover the tail of slide 1 and all of slide 2
    EXPECT_EQ(result.frames_scanned, 15u);
    EXPECT_EQ(result.source_indices, (std::vector<std::size_t>{15, 20}));
}

TEST_F(VideoProcessingTest, HighThresholdKeepsFirstFrameOnly) {
    config_.threshold = 1e9;
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    EXPECT_EQ(result.source_indices, (std::vector<std::size_t>{0}));
}

TEST_F(VideoProcessingTest, SummaryJson) {
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    json summary = summary_json(result);
    EXPECT_EQ(summary["video_id"], "lecture");
    EXPECT_EQ(summary["slide_count"], 4);
    EXPECT_EQ(summary["images"].size(), 4u);
    EXPECT_TRUE(summary["deck_path"].is_null());
    EXPECT_EQ(summary["used_cache"], false);
    EXPECT_GE(summary["processing_time_ms"].get<long long>(), 0);
}

TEST_F(VideoProcessingTest, BuildsDeckWhenRequested) {
    if (!command_available("zip")) {
        GTEST_SKIP() << "zip is not installed";
    }
    config_.build_deck = true;
    config_.output = (root_ / "decks").string() + "/";
    SlideExtractor extractor(config_);
    auto result = extractor.run(video_.string());

    ASSERT_TRUE(result.deck_path.has_value());
    EXPECT_EQ(*result.deck_path, fs::absolute(root_ / "decks" / "lecture.pptx"));
    EXPECT_TRUE(fs::is_regular_file(*result.deck_path));
}

TEST_F(VideoProcessingTest, UnresolvableLocatorIsConfigError) {
    SlideExtractor extractor(config_);

    EXPECT_THROW(extractor.run("https://example.com/talks/42"), ConfigError);
    EXPECT_FALSE(fs::exists(config_.storage_root / "images"));
}

TEST_F(VideoProcessingTest, MalformedTimeRejectedBeforeProcessing) {
    config_.start = "ninety";
    EXPECT_THROW(SlideExtractor extractor(config_), ConfigError);
}

TEST_F(VideoProcessingTest, EmptyWindowIsConfigError) {
    config_.start = "00:03";
    config_.end = "00:02";
    SlideExtractor extractor(config_);

    EXPECT_THROW(extractor.run(video_.string()), ConfigError);
    // A failed extraction leaves nothing that looks like a cache hit
    EXPECT_FALSE(fs::exists(config_.storage_root / "images" / "lecture"));
}

TEST_F(VideoProcessingTest, CropWithHugeOriginIsConfigError) {
    config_.crop = CropRegion{std::numeric_limits<int>::max(), 0, 1, 1};
    SlideExtractor extractor(config_);

    EXPECT_THROW(extractor.run(video_.string()), ConfigError);
    EXPECT_FALSE(fs::exists(config_.storage_root / "images" /
                            ("lecture" + config_.crop->signature())));
}

TEST_F(VideoProcessingTest, MissingDownloaderIsAcquisitionError) {
    config_.fetcher_executable = "vid2slides-no-such-downloader";
    SlideExtractor extractor(config_);

    EXPECT_THROW(extractor.run("https://www.youtube.com/watch?v=abc123"), AcquisitionError);
}

} // namespace vid2slides
