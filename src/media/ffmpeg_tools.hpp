/**
 * @file    ffmpeg_tools.hpp
 * @brief   ffmpeg / ffprobe backed media tools
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Scene detection:
 *   ffmpeg -i <media> -filter_complex "select='gt(scene,T)',showinfo" -f null -
 *   showinfo prints one line with "pts_time:<seconds>" per selected frame.
 *
 * Trimming:
 *   ffmpeg -y -ss <start> -to <end> -i <media> -c copy <output>
 *
 * Probing:
 *   ffprobe prints width, height and duration on separate lines.
 */

#pragma once

#include "core/media_tools.hpp"
#include "media/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace wms {

class FfmpegSceneDetector : public SceneDetector {
public:
    FfmpegSceneDetector(const ProcessRunner& runner,
                        std::string ffmpeg = "ffmpeg",
                        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @return  Combined ffmpeg log output
     *
     * @throws AppError  ffmpeg exited with non-zero status
     */
    std::string detect_scenes(const std::filesystem::path& media, double threshold) override;

private:
    const ProcessRunner& runner_;
    std::string ffmpeg_;
    std::shared_ptr<spdlog::logger> logger_;
};

class FfmpegTrimmer : public Trimmer {
public:
    FfmpegTrimmer(const ProcessRunner& runner,
                  std::string ffmpeg = "ffmpeg",
                  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @throws AppError  ffmpeg exited with non-zero status
     */
    void trim(const std::filesystem::path& media,
              double start_time,
              double end_time,
              const std::filesystem::path& output) override;

private:
    const ProcessRunner& runner_;
    std::string ffmpeg_;
    std::shared_ptr<spdlog::logger> logger_;
};

class FfprobeProber : public Prober {
public:
    FfprobeProber(const ProcessRunner& runner,
                  std::string ffprobe = "ffprobe",
                  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @throws AppError  ffprobe failed or printed unusable values
     */
    MediaInfo probe(const std::filesystem::path& media) override;

private:
    const ProcessRunner& runner_;
    std::string ffprobe_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * Parse ffprobe output: width, height, duration, one per line
 *
 * Blank lines are ignored; lines after the third are ignored.
 *
 * @throws AppError  fewer than three values, or a value that is not a
 *                   number (ffprobe prints "N/A" for unknown fields)
 */
[[nodiscard]] MediaInfo parse_probe_output(const std::string& output);

}  // namespace wms
