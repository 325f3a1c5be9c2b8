/**
 * @file    video.hpp
 * @brief   Imported video record
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace wms {

/**
 * Frame size of a video stream
 */
struct Resolution {
    int width{0};
    int height{0};
};

/**
 * Imported video (read-only to the pipeline)
 *
 * Built by the importer from probe output. The identity stays
 * kUnassignedId until the repository stores the video and hands back
 * a copy carrying the assigned id.
 */
class Video {
public:
    /**
     * @throws std::invalid_argument  negative duration, non-positive
     *                                resolution, empty path, or a URL source
     *                                without origin URL
     */
    Video(SourceKind source_kind,
          std::filesystem::path source_path,
          std::optional<std::string> original_url,
          double duration,
          Resolution resolution,
          std::string import_timestamp);

    [[nodiscard]] VideoId id() const noexcept { return id_; }
    [[nodiscard]] SourceKind source_kind() const noexcept { return source_kind_; }
    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] const std::optional<std::string>& original_url() const noexcept { return original_url_; }
    [[nodiscard]] double duration() const noexcept { return duration_; }
    [[nodiscard]] Resolution resolution() const noexcept { return resolution_; }
    [[nodiscard]] const std::string& import_timestamp() const noexcept { return import_timestamp_; }

    // Copy of this video carrying the identity assigned by the repository
    [[nodiscard]] Video with_id(VideoId id) const;

private:
    VideoId id_{kUnassignedId};
    SourceKind source_kind_;
    std::filesystem::path source_path_;
    std::optional<std::string> original_url_;
    double duration_;
    Resolution resolution_;
    std::string import_timestamp_;
};

// Current UTC time as ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] std::string utc_timestamp_now();

}  // namespace wms
