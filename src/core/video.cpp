/**
 * @file    video.cpp
 * @brief   Imported video record
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/video.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <stdexcept>

namespace wms {

Video::Video(SourceKind source_kind,
             std::filesystem::path source_path,
             std::optional<std::string> original_url,
             double duration,
             Resolution resolution,
             std::string import_timestamp)
    : source_kind_(source_kind)
    , source_path_(std::move(source_path))
    , original_url_(std::move(original_url))
    , duration_(duration)
    , resolution_(resolution)
    , import_timestamp_(std::move(import_timestamp)) {

    if (source_path_.empty()) {
        throw std::invalid_argument("Video source path must not be empty");
    }
    if (duration_ < 0.0) {
        throw std::invalid_argument("Video duration must be non-negative");
    }
    if (resolution_.width <= 0 || resolution_.height <= 0) {
        throw std::invalid_argument("Video resolution must be positive");
    }
    if (source_kind_ == SourceKind::Url && !original_url_) {
        throw std::invalid_argument("URL videos must record their origin URL");
    }
}

Video Video::with_id(VideoId id) const {
    Video copy = *this;
    copy.id_ = id;
    return copy;
}

std::string utc_timestamp_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

}  // namespace wms
