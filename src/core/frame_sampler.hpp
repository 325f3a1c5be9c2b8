/**
 * @file    frame_sampler.hpp
 * @brief   Fixed-rate frame sampling of a clip
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/clip_timeline.hpp"
#include "core/media_tools.hpp"
#include "core/types.hpp"
#include "core/video.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace wms {

/**
 * Sampled frames of one clip
 *
 * frames[i] was taken at timestamps[i] (absolute video time, seconds).
 * Timestamps are strictly increasing.
 */
struct FrameBatch {
    ClipId clip_id{kUnassignedId};
    std::vector<cv::Mat> frames;
    std::vector<double> timestamps;

    /**
     * @throws std::invalid_argument  timestamp not after the previous one
     */
    void add_frame(cv::Mat frame, double timestamp);

    [[nodiscard]] std::size_t size() const noexcept { return frames.size(); }
    [[nodiscard]] bool empty() const noexcept { return frames.empty(); }
};

/**
 * Open decoder on a media file
 *
 * The decoder is released when the object is destroyed.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Position the decoder at offset seconds from the start of the file
    virtual bool seek(double offset) = 0;

    // Decode the next frame; false at end of stream or on decode error
    virtual bool read(cv::Mat& frame) = 0;
};

class FrameSourceFactory {
public:
    virtual ~FrameSourceFactory() = default;

    // nullptr when the file cannot be opened
    virtual std::unique_ptr<FrameSource> open(const std::filesystem::path& media) = 0;
};

/**
 * Samples clips at a fixed rate
 *
 * A clip is first cut out of its video into its own segment file (stream
 * copy) under the work directory. The segment path is cached on the clip,
 * so sampling the same clip again reuses the file.
 */
class FrameSampler {
public:
    /**
     * @param trimmer   Segment cutter (must outlive the sampler)
     * @param sources   Decoder factory (must outlive the sampler)
     * @param work_dir  Directory for segment files, created on demand
     * @param logger    Log sink
     */
    FrameSampler(Trimmer& trimmer,
                 FrameSourceFactory& sources,
                 std::filesystem::path work_dir,
                 std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Sample a clip every 1/fps seconds
     *
     * Sampling starts at the clip start and stops before the clip end, or
     * at the first frame that cannot be read. A short or empty batch is a
     * valid result.
     *
     * @param clip         Clip to sample; its segment_path is filled in
     * @param video        Video the clip belongs to
     * @param fps          Sampling rate, > 0
     * @param cancel_flag  Optional, checked between frames
     * @return             Frames with timestamps clip.start_time + i / fps
     *
     * @throws std::invalid_argument  fps <= 0
     * @throws AppError               trimming failed or the segment cannot
     *                                be opened
     */
    FrameBatch extract(Clip& clip,
                       const Video& video,
                       double fps,
                       std::atomic<bool>* cancel_flag = nullptr);

    /**
     * Segment file name for a clip
     *
     * Keyed by clip id. Unpersisted clips use a "temp" placeholder plus
     * their time range so two of them never share a file.
     */
    [[nodiscard]] std::filesystem::path segment_path_for(const Clip& clip, const Video& video) const;

    [[nodiscard]] const std::filesystem::path& work_dir() const noexcept { return work_dir_; }

private:
    void materialize_segment(Clip& clip, const Video& video);

    Trimmer& trimmer_;
    FrameSourceFactory& sources_;
    std::filesystem::path work_dir_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wms
