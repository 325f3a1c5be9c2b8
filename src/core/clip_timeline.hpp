/**
 * @file    clip_timeline.hpp
 * @brief   Scene-bounded clip partition of a video, with merge and split
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Clips are held in an arena addressed by ClipKey. A key is stable for the
 * lifetime of the clip inside this timeline and is independent of the
 * persisted ClipId, which stays kUnassignedId until the repository assigns
 * one (see assign_id()).
 *
 * Every edit is a replace() transaction: a set of keys goes out, a set of
 * new clips comes in, and the caller gets the new keys back. Nobody holds a
 * reference into a list that another edit reshuffles.
 *
 * Single writer: the timeline has no internal locking.
 */

#pragma once

#include "core/media_tools.hpp"
#include "core/types.hpp"
#include "core/video.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wms {

/**
 * Contiguous time range [start_time, end_time) of one video, in seconds
 */
struct Clip {
    ClipId id{kUnassignedId};
    VideoId video_id{kUnassignedId};
    double start_time{0.0};
    double end_time{0.0};

    // Stream-copied segment file, filled in lazily by FrameSampler
    std::optional<std::filesystem::path> segment_path;

    [[nodiscard]] double duration() const noexcept { return end_time - start_time; }
};

/**
 * @throws std::invalid_argument  start_time < 0 or start_time >= end_time
 */
void validate_clip(const Clip& clip);

/**
 * Extract every "pts_time:<seconds>" value from a scene detector report
 *
 * @return  Timestamps sorted ascending; all other report text is ignored
 */
[[nodiscard]] std::vector<double> parse_scene_boundaries(const std::string& report);

/**
 * Turn sorted boundaries into clips covering [0, duration]
 *
 * n usable boundaries give n+1 clips. Boundaries at or before 0, at or
 * after duration, or repeating the previous one would produce empty clips
 * and are dropped. A zero duration gives no clips.
 */
[[nodiscard]] std::vector<Clip> partition_clips(VideoId video_id,
                                                const std::vector<double>& boundaries,
                                                double duration);

using ClipKey = std::uint64_t;

class ClipTimeline {
public:
    /**
     * @param detector  Scene detector (must outlive the timeline)
     * @param logger    Log sink
     */
    explicit ClipTimeline(SceneDetector& detector,
                          std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Detect scene boundaries and replace the video's clips with the
     * resulting partition
     *
     * @param video            Imported video
     * @param scene_threshold  Scene score threshold, strictly inside (0, 1)
     * @return                 Keys of the new clips in time order
     *
     * @throws std::invalid_argument  threshold out of range (checked before
     *                                the detector runs)
     * @throws AppError               detector failure
     */
    std::vector<ClipKey> detect(const Video& video, double scene_threshold);

    /**
     * Replace the selected clips with their envelope [min start, max end]
     *
     * Gaps or overlaps inside the selection are not rejected; a gap is
     * logged as a warning and covered by the merged clip.
     *
     * @param ids  Non-empty, strictly ascending persisted ids of clips that
     *             belong to the same video
     * @return     Key of the merged clip (identity unassigned)
     *
     * @throws std::invalid_argument  empty/unsorted/unknown ids, mixed videos
     */
    ClipKey merge(const std::vector<ClipId>& ids);

    /**
     * Replace a clip with [start, split_time) and [split_time, end)
     *
     * @return  Keys of the two halves in time order (identities unassigned)
     *
     * @throws std::invalid_argument  unknown id or split_time not strictly
     *                                inside the clip
     */
    std::pair<ClipKey, ClipKey> split(ClipId id, double split_time);

    /**
     * Atomic edit: validate everything, then remove and insert
     *
     * @throws std::invalid_argument  unknown key or invalid clip; the
     *                                timeline is unchanged in that case
     */
    std::vector<ClipKey> replace(const std::vector<ClipKey>& removed, std::vector<Clip> added);

    /**
     * Record the persisted identity of a clip
     *
     * @throws std::out_of_range      unknown key
     * @throws std::invalid_argument  id unassigned or used by another clip
     */
    void assign_id(ClipKey key, ClipId id);

    [[nodiscard]] Clip& at(ClipKey key);
    [[nodiscard]] const Clip& at(ClipKey key) const;

    [[nodiscard]] std::optional<ClipKey> find(ClipId id) const;

    // Keys of a video's clips ordered by start time
    [[nodiscard]] std::vector<ClipKey> keys(VideoId video_id) const;

    // Copies of a video's clips ordered by start time
    [[nodiscard]] std::vector<Clip> clips(VideoId video_id) const;

    [[nodiscard]] std::size_t size() const noexcept { return clips_.size(); }

private:
    SceneDetector& detector_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unordered_map<ClipKey, Clip> clips_;
    ClipKey next_key_{1};
};

}  // namespace wms
