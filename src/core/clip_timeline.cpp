/**
 * @file    clip_timeline.cpp
 * @brief   Scene-bounded clip partition of a video, with merge and split
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/clip_timeline.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <regex>
#include <stdexcept>
#include <unordered_set>

namespace wms {

namespace {

// Tolerance when checking that merged clips touch each other
constexpr double kContiguityEpsilon = 1e-6;

void sort_by_start(std::vector<ClipKey>& keys, const std::unordered_map<ClipKey, Clip>& clips) {
    std::sort(keys.begin(), keys.end(), [&](ClipKey a, ClipKey b) {
        const Clip& ca = clips.at(a);
        const Clip& cb = clips.at(b);
        if (ca.start_time != cb.start_time) return ca.start_time < cb.start_time;
        return a < b;
    });
}

}  // anonymous namespace

void validate_clip(const Clip& clip) {
    if (clip.start_time < 0.0) {
        throw std::invalid_argument(
            fmt::format("Clip start time must be non-negative (got {})", clip.start_time));
    }
    if (!(clip.start_time < clip.end_time)) {
        throw std::invalid_argument(
            fmt::format("Clip start time {} must be before end time {}",
                        clip.start_time, clip.end_time));
    }
}

std::vector<double> parse_scene_boundaries(const std::string& report) {
    // showinfo prints %.6g, so small values come out as 3.33e-05
    static const std::regex kPtsTime(R"(pts_time:\s*(\d+(?:\.\d*)?(?:[eE][-+]?\d+)?))");

    std::vector<double> boundaries;
    for (auto it = std::sregex_iterator(report.begin(), report.end(), kPtsTime);
         it != std::sregex_iterator(); ++it) {
        boundaries.push_back(std::stod((*it)[1].str()));
    }

    std::sort(boundaries.begin(), boundaries.end());
    return boundaries;
}

std::vector<Clip> partition_clips(VideoId video_id,
                                  const std::vector<double>& boundaries,
                                  double duration) {
    std::vector<Clip> clips;
    if (duration <= 0.0) {
        return clips;
    }

    double prev = 0.0;
    for (double boundary : boundaries) {
        if (boundary <= prev || boundary >= duration) {
            continue;
        }
        clips.push_back(Clip{kUnassignedId, video_id, prev, boundary, std::nullopt});
        prev = boundary;
    }
    clips.push_back(Clip{kUnassignedId, video_id, prev, duration, std::nullopt});
    return clips;
}

ClipTimeline::ClipTimeline(SceneDetector& detector, std::shared_ptr<spdlog::logger> logger)
    : detector_(detector)
    , logger_(std::move(logger)) {}

// =============================================================================
// Scene detection
// =============================================================================

std::vector<ClipKey> ClipTimeline::detect(const Video& video, double scene_threshold) {
    if (!(scene_threshold > 0.0 && scene_threshold < 1.0)) {
        throw std::invalid_argument(
            fmt::format("scene_threshold must be between 0.0 and 1.0 (exclusive), got {}",
                        scene_threshold));
    }

    logger_->info("Detecting scenes in {} (threshold {:.2f})",
                  video.source_path().filename(), scene_threshold);

    const std::string report = detector_.detect_scenes(video.source_path(), scene_threshold);
    const std::vector<double> boundaries = parse_scene_boundaries(report);
    std::vector<Clip> partition = partition_clips(video.id(), boundaries, video.duration());

    if (partition.empty()) {
        logger_->warn("Video {} has zero duration, no clips", video.source_path().filename());
    } else if (partition.size() != boundaries.size() + 1) {
        logger_->debug("Dropped {} degenerate scene boundaries",
                       boundaries.size() + 1 - partition.size());
    }
    logger_->info("Found {} scene boundaries, {} clips", boundaries.size(), partition.size());

    return replace(keys(video.id()), std::move(partition));
}

// =============================================================================
// Edits
// =============================================================================

ClipKey ClipTimeline::merge(const std::vector<ClipId>& ids) {
    if (ids.empty()) {
        throw std::invalid_argument("merge requires at least one clip id");
    }
    if (std::adjacent_find(ids.begin(), ids.end(), std::greater_equal<>()) != ids.end()) {
        throw std::invalid_argument("merge clip ids must be strictly ascending");
    }

    std::vector<ClipKey> selected;
    selected.reserve(ids.size());
    for (ClipId id : ids) {
        const auto key = find(id);
        if (!key) {
            throw std::invalid_argument(fmt::format("Clip id {} not found", id));
        }
        selected.push_back(*key);
    }

    const VideoId video_id = clips_.at(selected.front()).video_id;
    for (ClipKey key : selected) {
        if (clips_.at(key).video_id != video_id) {
            throw std::invalid_argument("Merged clips must belong to the same video");
        }
    }

    std::vector<ClipKey> ordered = selected;
    sort_by_start(ordered, clips_);

    Clip merged{kUnassignedId, video_id, clips_.at(ordered.front()).start_time, 0.0, std::nullopt};
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const Clip& clip = clips_.at(ordered[i]);
        merged.end_time = std::max(merged.end_time, clip.end_time);

        if (i > 0) {
            const Clip& prev = clips_.at(ordered[i - 1]);
            if (clip.start_time > prev.end_time + kContiguityEpsilon) {
                logger_->warn("Merging across a gap: [{:.3f}, {:.3f}) is not covered by the selection",
                              prev.end_time, clip.start_time);
            }
        }
    }

    const auto added = replace(selected, {merged});
    logger_->info("Merged {} clips into [{:.3f}, {:.3f})", ids.size(), merged.start_time, merged.end_time);
    return added.front();
}

std::pair<ClipKey, ClipKey> ClipTimeline::split(ClipId id, double split_time) {
    const auto key = find(id);
    if (!key) {
        throw std::invalid_argument(fmt::format("Clip id {} not found", id));
    }

    const Clip& target = clips_.at(*key);
    if (!(target.start_time < split_time && split_time < target.end_time)) {
        throw std::invalid_argument(
            fmt::format("split_time {} must lie strictly inside clip [{}, {})",
                        split_time, target.start_time, target.end_time));
    }

    Clip first{kUnassignedId, target.video_id, target.start_time, split_time, std::nullopt};
    Clip second{kUnassignedId, target.video_id, split_time, target.end_time, std::nullopt};

    const auto added = replace({*key}, {first, second});
    logger_->info("Split clip {} at {:.3f}", id, split_time);
    return {added[0], added[1]};
}

std::vector<ClipKey> ClipTimeline::replace(const std::vector<ClipKey>& removed, std::vector<Clip> added) {
    std::unordered_set<ClipKey> seen;
    for (ClipKey key : removed) {
        if (!clips_.contains(key)) {
            throw std::invalid_argument(fmt::format("Clip key {} not in timeline", key));
        }
        if (!seen.insert(key).second) {
            throw std::invalid_argument(fmt::format("Clip key {} removed twice", key));
        }
    }
    for (const Clip& clip : added) {
        validate_clip(clip);
    }

    for (ClipKey key : removed) {
        clips_.erase(key);
    }

    std::vector<ClipKey> keys;
    keys.reserve(added.size());
    for (Clip& clip : added) {
        const ClipKey key = next_key_++;
        clips_.emplace(key, std::move(clip));
        keys.push_back(key);
    }
    return keys;
}

// =============================================================================
// Lookup
// =============================================================================

void ClipTimeline::assign_id(ClipKey key, ClipId id) {
    if (!is_assigned(id)) {
        throw std::invalid_argument("Cannot assign the unassigned clip id");
    }
    Clip& clip = at(key);

    const auto existing = find(id);
    if (existing && *existing != key) {
        throw std::invalid_argument(fmt::format("Clip id {} already used by another clip", id));
    }
    clip.id = id;
}

Clip& ClipTimeline::at(ClipKey key) {
    const auto it = clips_.find(key);
    if (it == clips_.end()) {
        throw std::out_of_range(fmt::format("Clip key {} not in timeline", key));
    }
    return it->second;
}

const Clip& ClipTimeline::at(ClipKey key) const {
    const auto it = clips_.find(key);
    if (it == clips_.end()) {
        throw std::out_of_range(fmt::format("Clip key {} not in timeline", key));
    }
    return it->second;
}

std::optional<ClipKey> ClipTimeline::find(ClipId id) const {
    if (!is_assigned(id)) return std::nullopt;
    for (const auto& [key, clip] : clips_) {
        if (clip.id == id) return key;
    }
    return std::nullopt;
}

std::vector<ClipKey> ClipTimeline::keys(VideoId video_id) const {
    std::vector<ClipKey> result;
    for (const auto& [key, clip] : clips_) {
        if (clip.video_id == video_id) result.push_back(key);
    }
    sort_by_start(result, clips_);
    return result;
}

std::vector<Clip> ClipTimeline::clips(VideoId video_id) const {
    std::vector<Clip> result;
    for (ClipKey key : keys(video_id)) {
        result.push_back(clips_.at(key));
    }
    return result;
}

}  // namespace wms
