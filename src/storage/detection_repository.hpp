/**
 * @file    detection_repository.hpp
 * @brief   Storage of videos, clips and detections
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The repository is the single source of record identities. Records are
 * handed in with kUnassignedId and the returned ids are authoritative
 * from then on. Ids start at 1 and increase per record type.
 */

#pragma once

#include "core/clip_timeline.hpp"
#include "core/ocr_aggregator.hpp"
#include "core/types.hpp"
#include "core/video.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wms {

struct StoredDetection {
    DetectionId id;
    Detection detection;
};

/**
 * Detection filter; unset fields match everything
 */
struct DetectionQuery {
    std::optional<std::string> text;       // Case-insensitive substring
    std::optional<double> min_confidence;  // Inclusive
    std::optional<ClipId> clip_id;
};

class DetectionRepository {
public:
    virtual ~DetectionRepository() = default;

    /**
     * @return  Assigned video id
     */
    virtual VideoId add_video(const Video& video) = 0;

    /**
     * @return  Assigned clip id
     * @throws std::invalid_argument  unknown video or invalid time range
     */
    virtual ClipId add_clip(const Clip& clip) = 0;

    /**
     * Overwrite a stored clip (time range, segment path) by its id
     *
     * @throws std::invalid_argument  unknown id, video changed or invalid range
     */
    virtual void update_clip(const Clip& clip) = 0;

    /**
     * Drop a clip that an edit replaced
     *
     * @throws std::invalid_argument  unknown id or clip still has detections
     */
    virtual void remove_clip(ClipId id) = 0;

    /**
     * @return  Assigned detection id
     * @throws std::invalid_argument  unknown video or clip id
     */
    virtual DetectionId add_detection(const Detection& detection) = 0;

    [[nodiscard]] virtual std::optional<Video> find_video(VideoId id) const = 0;
    [[nodiscard]] virtual std::optional<Clip> find_clip(ClipId id) const = 0;

    /**
     * @return  Matching detections ordered by id
     * @throws std::invalid_argument  min_confidence outside [0, 1]
     */
    [[nodiscard]] virtual std::vector<StoredDetection> query(const DetectionQuery& filter) const = 0;
};

/**
 * Process-local repository
 *
 * All operations are serialized by an internal mutex.
 */
class InMemoryDetectionRepository : public DetectionRepository {
public:
    VideoId add_video(const Video& video) override;
    ClipId add_clip(const Clip& clip) override;
    void update_clip(const Clip& clip) override;
    void remove_clip(ClipId id) override;
    DetectionId add_detection(const Detection& detection) override;

    [[nodiscard]] std::optional<Video> find_video(VideoId id) const override;
    [[nodiscard]] std::optional<Clip> find_clip(ClipId id) const override;
    [[nodiscard]] std::vector<StoredDetection> query(const DetectionQuery& filter) const override;

private:
    mutable std::mutex mutex_;
    std::map<VideoId, Video> videos_;
    std::map<ClipId, Clip> clips_;
    std::map<DetectionId, Detection> detections_;
    VideoId next_video_id_{1};
    ClipId next_clip_id_{1};
    DetectionId next_detection_id_{1};
};

/**
 * Write detections as CSV with header
 *
 * Columns: watermark_id, video_id, clip_id, timestamp, extracted_text,
 * confidence, roi_x, roi_y, roi_width, roi_height. Parent directories are
 * created.
 *
 * @throws AppError  file cannot be written
 */
void export_csv(const std::vector<StoredDetection>& rows, const std::filesystem::path& output);

// Quote a CSV field when it contains a separator, quote or line break
[[nodiscard]] std::string csv_escape(const std::string& field);

}  // namespace wms
