// Frame sampler: segment materialization and fixed-rate sampling
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/errors.hpp"
#include "core/frame_sampler.hpp"
#include "utils/logging.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>

using namespace wms;
using wms::test::FakeFrameSourceFactory;
using wms::test::FakeTrimmer;
using wms::test::make_video;

namespace {

std::filesystem::path test_work_dir() {
    return std::filesystem::temp_directory_path() / "wms_tests" / "sampler";
}

}  // namespace

TEST_CASE("FrameBatch requires strictly increasing timestamps") {
    FrameBatch batch;
    batch.add_frame(cv::Mat(2, 2, CV_8UC1), 1.0);
    REQUIRE_THROWS_AS(batch.add_frame(cv::Mat(2, 2, CV_8UC1), 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(batch.add_frame(cv::Mat(2, 2, CV_8UC1), 0.5), std::invalid_argument);
    REQUIRE(batch.size() == 1);
}

TEST_CASE("FrameSampler samples a 0.3 s clip at 10 fps into 3 frames") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.available_frames = 3;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    auto video = make_video(1, 10.0);
    Clip clip{4, 1, 5.0, 5.3, std::nullopt};

    auto batch = sampler.extract(clip, video, 10.0);
    REQUIRE(batch.clip_id == 4);
    REQUIRE(batch.size() == 3);
    REQUIRE(batch.frames.size() == batch.timestamps.size());
    REQUIRE(batch.timestamps[0] == Catch::Approx(5.0));
    REQUIRE(batch.timestamps[1] == Catch::Approx(5.1));
    REQUIRE(batch.timestamps[2] == Catch::Approx(5.2));
    REQUIRE(batch.timestamps[0] < batch.timestamps[1]);
    REQUIRE(batch.timestamps[1] < batch.timestamps[2]);

    // Seeks are relative to the segment start
    REQUIRE(sources.seeks.size() == 3);
    REQUIRE(sources.seeks[0] == Catch::Approx(0.0));
    REQUIRE(sources.seeks[2] == Catch::Approx(0.2));
}

TEST_CASE("FrameSampler never samples at the exclusive clip end") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.available_frames = 100;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    // 0.4 - 0.1 rounds above 0.3
    Clip clip{1, 1, 0.1, 0.4, std::nullopt};
    auto batch = sampler.extract(clip, make_video(1, 10.0), 10.0);
    REQUIRE(batch.size() == 3);
    REQUIRE(batch.timestamps.back() < 0.4);
    REQUIRE(batch.timestamps.back() == Catch::Approx(0.3));

    // Adjacent clips do not share a sample
    Clip next{2, 1, 0.4, 0.7, std::nullopt};
    auto next_batch = sampler.extract(next, make_video(1, 10.0), 10.0);
    REQUIRE(next_batch.size() == 3);
    REQUIRE(next_batch.timestamps.front() == Catch::Approx(0.4));
    REQUIRE(next_batch.timestamps.front() > batch.timestamps.back());
}

TEST_CASE("FrameSampler stops at the first unreadable frame") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.available_frames = 2;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    Clip clip{1, 1, 0.0, 10.0, std::nullopt};
    auto batch = sampler.extract(clip, make_video(1, 10.0), 1.0);
    REQUIRE(batch.size() == 2);

    sources.available_frames = 0;
    Clip other{2, 1, 0.0, 10.0, std::nullopt};
    REQUIRE(sampler.extract(other, make_video(1, 10.0), 1.0).empty());
}

TEST_CASE("FrameSampler trims once and caches the segment path") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.available_frames = 100;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    auto video = make_video(1, 10.0);
    Clip clip{7, 1, 2.0, 4.0, std::nullopt};

    sampler.extract(clip, video, 2.0);
    REQUIRE(trimmer.calls.size() == 1);
    REQUIRE(trimmer.calls[0].media.string() == video.source_path().string());
    REQUIRE(trimmer.calls[0].start == 2.0);
    REQUIRE(trimmer.calls[0].end == 4.0);
    REQUIRE(clip.segment_path.has_value());
    REQUIRE(clip.segment_path->string() == trimmer.calls[0].output.string());
    REQUIRE(clip.segment_path->filename().string() == "clip_7.mp4");

    sampler.extract(clip, video, 2.0);
    REQUIRE(trimmer.calls.size() == 1);
    REQUIRE(sources.opened.size() == 2);
    REQUIRE(sources.opened[1].string() == clip.segment_path->string());
}

TEST_CASE("FrameSampler names unpersisted segments by time range") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    Clip a{kUnassignedId, 1, 0.0, 2.5, std::nullopt};
    Clip b{kUnassignedId, 1, 2.5, 5.0, std::nullopt};
    auto video = make_video(1, 10.0);
    REQUIRE(sampler.segment_path_for(a, video).filename().string() == "clip_temp_1_0-2500.mp4");
    REQUIRE(sampler.segment_path_for(a, video).string() != sampler.segment_path_for(b, video).string());
}

TEST_CASE("FrameSampler rejects non-positive fps before trimming") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    Clip clip{1, 1, 0.0, 1.0, std::nullopt};
    REQUIRE_THROWS_AS(sampler.extract(clip, make_video(), 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(sampler.extract(clip, make_video(), -1.0), std::invalid_argument);
    REQUIRE(trimmer.calls.empty());
    REQUIRE_FALSE(clip.segment_path.has_value());
}

TEST_CASE("FrameSampler reports an unopenable segment as AppError") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.fail_open = true;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    Clip clip{3, 1, 0.0, 1.0, std::nullopt};
    try {
        (void)sampler.extract(clip, make_video(), 1.0);
        FAIL("expected AppError");
    } catch (const AppError& e) {
        REQUIRE(std::string(e.user_message()) == "Cannot open clip file for frame extraction.");
        REQUIRE(e.detail().find("clip_3.mp4") != std::string::npos);
    }
}

TEST_CASE("FrameSampler stops when cancelled") {
    FakeTrimmer trimmer;
    FakeFrameSourceFactory sources;
    sources.available_frames = 100;
    FrameSampler sampler(trimmer, sources, test_work_dir(), make_null_logger());

    std::atomic<bool> cancel{true};
    Clip clip{1, 1, 0.0, 10.0, std::nullopt};
    auto batch = sampler.extract(clip, make_video(), 1.0, &cancel);
    REQUIRE(batch.empty());
}
