/**
 * @file    frame_sampler.cpp
 * @brief   Fixed-rate frame sampling of a clip
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/frame_sampler.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace wms {

namespace {

// Relative slack when comparing a sample offset against the clip duration
constexpr double kTimeTolerance = 1e-9;

}  // anonymous namespace

void FrameBatch::add_frame(cv::Mat frame, double timestamp) {
    if (!timestamps.empty() && !(timestamp > timestamps.back())) {
        throw std::invalid_argument(
            fmt::format("Frame timestamp {} is not after {}", timestamp, timestamps.back()));
    }
    frames.push_back(std::move(frame));
    timestamps.push_back(timestamp);
}

FrameSampler::FrameSampler(Trimmer& trimmer,
                           FrameSourceFactory& sources,
                           std::filesystem::path work_dir,
                           std::shared_ptr<spdlog::logger> logger)
    : trimmer_(trimmer)
    , sources_(sources)
    , work_dir_(std::move(work_dir))
    , logger_(std::move(logger)) {}

std::filesystem::path FrameSampler::segment_path_for(const Clip& clip, const Video& video) const {
    std::string ext = video.source_path().extension().string();
    if (ext.empty()) ext = ".mp4";

    if (is_assigned(clip.id)) {
        return work_dir_ / fmt::format("clip_{}{}", clip.id, ext);
    }

    const auto start_ms = std::llround(clip.start_time * 1000.0);
    const auto end_ms = std::llround(clip.end_time * 1000.0);
    return work_dir_ / fmt::format("clip_temp_{}_{}-{}{}", video.id(), start_ms, end_ms, ext);
}

void FrameSampler::materialize_segment(Clip& clip, const Video& video) {
    std::error_code ec;
    std::filesystem::create_directories(work_dir_, ec);
    if (ec) {
        logger_->error("Cannot create work directory {}: {}", work_dir_, ec.message());
        throw AppError("Cannot create working directory.", fmt::format("{}: {}", to_utf8(work_dir_), ec.message()));
    }

    const std::filesystem::path output = segment_path_for(clip, video);
    logger_->debug("Trimming [{:.3f}, {:.3f}) of {} into {}",
                   clip.start_time, clip.end_time, video.source_path().filename(), output.filename());

    trimmer_.trim(video.source_path(), clip.start_time, clip.end_time, output);
    clip.segment_path = output;
}

FrameBatch FrameSampler::extract(Clip& clip,
                                 const Video& video,
                                 double fps,
                                 std::atomic<bool>* cancel_flag) {
    if (!(fps > 0.0)) {
        throw std::invalid_argument(fmt::format("fps must be greater than 0, got {}", fps));
    }

    if (!clip.segment_path) {
        materialize_segment(clip, video);
    }

    std::unique_ptr<FrameSource> source = sources_.open(*clip.segment_path);
    if (!source) {
        logger_->error("Cannot open clip segment: {}", *clip.segment_path);
        throw AppError("Cannot open clip file for frame extraction.", to_utf8(*clip.segment_path));
    }

    auto start = std::chrono::steady_clock::now();

    FrameBatch batch;
    batch.clip_id = clip.id;

    // end - start carries rounding error (0.4 - 0.1 > 0.3); an offset within
    // tolerance of the duration is the exclusive end, the next clip's first frame
    const double duration = clip.duration();
    const double limit = duration - kTimeTolerance * std::max(1.0, duration);
    cv::Mat frame;
    for (long step = 0;; ++step) {
        const double offset = static_cast<double>(step) / fps;
        if (offset >= limit) break;

        if (cancel_flag && cancel_flag->load(std::memory_order_relaxed)) {
            logger_->debug("Frame sampling cancelled at step {}", step);
            break;
        }

        if (!source->seek(offset) || !source->read(frame)) {
            logger_->debug("No frame at offset {:.3f}s, stopping", offset);
            break;
        }

        batch.add_frame(frame.clone(), clip.start_time + offset);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->info("Sampled {} frames from [{:.3f}, {:.3f}) at {} fps in {} ms",
                  batch.size(), clip.start_time, clip.end_time, fps, elapsed);

    return batch;
}

}  // namespace wms
