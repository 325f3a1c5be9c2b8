/**
 * @file    media_tools.hpp
 * @brief   Interfaces to the external media tools
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The pipeline never runs ffmpeg directly. Scene detection, trimming and
 * probing go through these interfaces so tests can substitute fakes; the
 * ffmpeg-backed implementations live in media/ffmpeg_tools.hpp.
 *
 * Implementations report tool failures as AppError.
 */

#pragma once

#include "core/video.hpp"

#include <filesystem>
#include <string>

namespace wms {

/**
 * Scene-change detector
 *
 * Returns the tool's raw text report. The caller extracts the
 * "pts_time:<seconds>" markers and ignores everything else.
 */
class SceneDetector {
public:
    virtual ~SceneDetector() = default;

    virtual std::string detect_scenes(const std::filesystem::path& media, double threshold) = 0;
};

/**
 * Stream-copy a time range of a media file into a new file (no re-encode)
 */
class Trimmer {
public:
    virtual ~Trimmer() = default;

    virtual void trim(const std::filesystem::path& media,
                      double start_time,
                      double end_time,
                      const std::filesystem::path& output) = 0;
};

/**
 * Stream properties reported by a probe
 */
struct MediaInfo {
    double duration{0.0};
    Resolution resolution;
};

/**
 * Read duration and resolution of a media file
 */
class Prober {
public:
    virtual ~Prober() = default;

    virtual MediaInfo probe(const std::filesystem::path& media) = 0;
};

}  // namespace wms
