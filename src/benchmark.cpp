#include "frame_selector.hpp"
#include "frame_source.hpp"
#include "similarity.hpp"
#include "slide_extractor.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdio>
#include <functional>
#include <random>
#include <stdexcept>
#include <opencv2/opencv.hpp>
#include <iostream>
#include <thread>

namespace vid2slides {

namespace {

// Slides that change every `hold` frames, with light sensor noise on top
void generate_talk_frames(int count, int hold, cv::Size size,
                          const std::function<void(const cv::Mat&)>& sink) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<> dis(0, 255);

    cv::Mat slide;
    for (int i = 0; i < count; ++i) {
        if (i % hold == 0) {
            slide = cv::Mat(size, CV_8UC3, cv::Scalar(dis(gen), dis(gen), dis(gen)));
            cv::rectangle(slide, cv::Point(size.width / 8, size.height / 8),
                          cv::Point(size.width / 2, size.height / 2),
                          cv::Scalar(dis(gen), dis(gen), dis(gen)), -1);
        }
        cv::Mat noise(size, CV_8UC3);
        cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(3));
        cv::Mat frame;
        cv::add(slide, noise, frame);
        sink(frame);
    }
}

std::vector<cv::Mat> make_talk_frames(int count, int hold, cv::Size size) {
    std::vector<cv::Mat> frames;
    frames.reserve(static_cast<size_t>(count));
    generate_talk_frames(count, hold, size, [&frames](const cv::Mat& frame) {
        frames.push_back(frame);
    });
    return frames;
}

} // namespace

static void BM_MeanSquaredError(benchmark::State& state) {
    cv::Size size(static_cast<int>(state.range(0)), static_cast<int>(state.range(0) * 9 / 16));
    cv::Mat a(size, CV_8UC3);
    cv::Mat b(size, CV_8UC3);
    cv::randu(a, cv::Scalar::all(0), cv::Scalar::all(255));
    cv::randu(b, cv::Scalar::all(0), cv::Scalar::all(255));

    for (auto _ : state) {
        benchmark::DoNotOptimize(mean_squared_error(a, b));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(a.total() * a.elemSize() * 2));
    state.counters["width"] = size.width;
}

static void BM_SelectFrames(benchmark::State& state) {
    auto frames = make_talk_frames(static_cast<int>(state.range(0)), 30, cv::Size(1280, 720));

    for (auto _ : state) {
        MemoryFrameSequence sequence(frames);
        auto start = std::chrono::high_resolution_clock::now();

        SelectionStats stats = select_frames(sequence, kDefaultThreshold, KeptFrameCallback{});

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(stats.frames_seen);
        state.counters["kept"] = static_cast<double>(stats.frames_kept);
        state.counters["frames_per_second"] = static_cast<double>(stats.frames_seen) / elapsed_seconds.count();
    }
}

class VideoScanFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!writer.open(video_path_, fourcc, 30.0, cv::Size(1920, 1080))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }
        generate_talk_frames(300, 45, cv::Size(1920, 1080), [&writer](const cv::Mat& frame) {
            writer << frame;
        });
        writer.release();

        config_.verbose = false;
        config_.build_deck = false;
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::remove(video_path_.c_str());
    }

protected:
    std::string video_path_ = "benchmark_video.avi";
    ExtractionConfig config_;
};

// Decode, crop and deduplicate a 10 second 1080p clip
BENCHMARK_DEFINE_F(VideoScanFixture, ExtractSlides)(benchmark::State& state) {
    if (state.range(0) != 0) {
        config_.crop = CropRegion{0, 0, 1280, 720};
    }
    SlideExtractor extractor(config_);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto slides = extractor.extract_slides(video_path_);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["slides"] = static_cast<double>(slides.size());
        state.counters["frames_per_second"] = 300.0 / elapsed_seconds.count();
    }
    state.SetLabel(state.range(0) != 0 ? "cropped" : "full frame");
}

BENCHMARK(BM_MeanSquaredError)->Arg(640)->Arg(1280)->Arg(1920)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_SelectFrames)->Arg(60)->Arg(150)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(VideoScanFixture, ExtractSlides)->Arg(0)->Arg(1)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace vid2slides

int main(int argc, char** argv) {
    std::cout << "vid2slides - Performance Benchmarks" << std::endl;
    std::cout << "===================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  OpenCV: " << CV_VERSION << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
