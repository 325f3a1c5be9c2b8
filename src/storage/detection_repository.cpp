/**
 * @file    detection_repository.cpp
 * @brief   Storage of videos, clips and detections
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "storage/detection_repository.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>
#include <fmt/os.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace wms {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // anonymous namespace

// =============================================================================
// InMemoryDetectionRepository
// =============================================================================

VideoId InMemoryDetectionRepository::add_video(const Video& video) {
    std::lock_guard<std::mutex> lock(mutex_);
    const VideoId id = next_video_id_++;
    videos_.emplace(id, video.with_id(id));
    return id;
}

ClipId InMemoryDetectionRepository::add_clip(const Clip& clip) {
    validate_clip(clip);

    std::lock_guard<std::mutex> lock(mutex_);
    if (videos_.find(clip.video_id) == videos_.end()) {
        throw std::invalid_argument(fmt::format("Unknown video id {}", clip.video_id));
    }

    const ClipId id = next_clip_id_++;
    Clip stored = clip;
    stored.id = id;
    clips_.emplace(id, std::move(stored));
    return id;
}

void InMemoryDetectionRepository::update_clip(const Clip& clip) {
    validate_clip(clip);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(clip.id);
    if (it == clips_.end()) {
        throw std::invalid_argument(fmt::format("Unknown clip id {}", clip.id));
    }
    if (it->second.video_id != clip.video_id) {
        throw std::invalid_argument(fmt::format("Clip {} cannot move from video {} to {}",
                                                clip.id, it->second.video_id, clip.video_id));
    }
    it->second = clip;
}

void InMemoryDetectionRepository::remove_clip(ClipId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(id);
    if (it == clips_.end()) {
        throw std::invalid_argument(fmt::format("Unknown clip id {}", id));
    }

    const bool referenced = std::any_of(detections_.begin(), detections_.end(),
        [id](const auto& entry) { return entry.second.clip_id() == id; });
    if (referenced) {
        throw std::invalid_argument(fmt::format("Clip {} still has detections", id));
    }
    clips_.erase(it);
}

DetectionId InMemoryDetectionRepository::add_detection(const Detection& detection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (videos_.find(detection.video_id()) == videos_.end()) {
        throw std::invalid_argument(fmt::format("Unknown video id {}", detection.video_id()));
    }

    auto clip = clips_.find(detection.clip_id());
    if (clip == clips_.end()) {
        throw std::invalid_argument(fmt::format("Unknown clip id {}", detection.clip_id()));
    }
    if (clip->second.video_id != detection.video_id()) {
        throw std::invalid_argument(fmt::format("Clip {} does not belong to video {}",
                                                detection.clip_id(), detection.video_id()));
    }

    const DetectionId id = next_detection_id_++;
    detections_.emplace(id, detection);
    return id;
}

std::optional<Video> InMemoryDetectionRepository::find_video(VideoId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = videos_.find(id);
    if (it == videos_.end()) return std::nullopt;
    return it->second;
}

std::optional<Clip> InMemoryDetectionRepository::find_clip(ClipId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(id);
    if (it == clips_.end()) return std::nullopt;
    return it->second;
}

std::vector<StoredDetection> InMemoryDetectionRepository::query(const DetectionQuery& filter) const {
    if (filter.min_confidence && !(*filter.min_confidence >= 0.0 && *filter.min_confidence <= 1.0)) {
        throw std::invalid_argument(
            fmt::format("min_confidence must be in [0, 1], got {}", *filter.min_confidence));
    }

    const std::string needle = filter.text ? to_lower(*filter.text) : std::string{};

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredDetection> rows;
    for (const auto& [id, detection] : detections_) {
        if (filter.clip_id && detection.clip_id() != *filter.clip_id) continue;
        if (filter.min_confidence && detection.confidence() < *filter.min_confidence) continue;
        if (filter.text && to_lower(detection.text()).find(needle) == std::string::npos) continue;
        rows.push_back({id, detection});
    }
    return rows;
}

// =============================================================================
// CSV export
// =============================================================================

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void export_csv(const std::vector<StoredDetection>& rows, const std::filesystem::path& output) {
    std::error_code ec;
    if (output.has_parent_path()) {
        std::filesystem::create_directories(output.parent_path(), ec);
        if (ec) {
            throw AppError("Cannot export detections.",
                           fmt::format("{}: {}", to_utf8(output.parent_path()), ec.message()));
        }
    }

    try {
        auto out = fmt::output_file(to_utf8(output));
        out.print("watermark_id,video_id,clip_id,timestamp,extracted_text,confidence,"
                  "roi_x,roi_y,roi_width,roi_height\n");
        for (const auto& row : rows) {
            const Detection& d = row.detection;
            out.print("{},{},{},{},{},{},{},{},{},{}\n",
                      row.id, d.video_id(), d.clip_id(), d.timestamp(),
                      csv_escape(d.text()), d.confidence(),
                      d.roi().x, d.roi().y, d.roi().width, d.roi().height);
        }
        out.close();
    } catch (const std::system_error& e) {
        throw AppError("Cannot export detections.", e.what());
    }
}

}  // namespace wms
