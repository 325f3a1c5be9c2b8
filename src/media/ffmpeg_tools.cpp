/**
 * @file    ffmpeg_tools.cpp
 * @brief   ffmpeg / ffprobe backed media tools
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "media/ffmpeg_tools.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <charconv>
#include <sstream>
#include <vector>

namespace wms {

namespace {

// ffmpeg accepts plain seconds for -ss / -to
std::string seconds_arg(double seconds) {
    return fmt::format("{:.3f}", seconds);
}

std::string trim_copy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

template<typename T>
bool parse_number(const std::string& text, T& value) {
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    return ec == std::errc{} && ptr == end;
}

}  // anonymous namespace

// =============================================================================
// FfmpegSceneDetector
// =============================================================================

FfmpegSceneDetector::FfmpegSceneDetector(const ProcessRunner& runner,
                                         std::string ffmpeg,
                                         std::shared_ptr<spdlog::logger> logger)
    : runner_(runner)
    , ffmpeg_(std::move(ffmpeg))
    , logger_(std::move(logger)) {}

std::string FfmpegSceneDetector::detect_scenes(const std::filesystem::path& media, double threshold) {
    const std::string filter = fmt::format("select='gt(scene,{})',showinfo", threshold);

    logger_->debug("ffmpeg scene filter: {}", filter);

    auto result = runner_.run({
        ffmpeg_, "-hide_banner", "-nostdin",
        "-i", to_utf8(media),
        "-filter_complex", filter,
        "-f", "null", "-"
    });

    if (!result.succeeded()) {
        logger_->error("Scene detection on {} failed with exit code {}", media, result.exit_code);
        throw AppError("Scene detection failed.", result.output);
    }
    return std::move(result.output);
}

// =============================================================================
// FfmpegTrimmer
// =============================================================================

FfmpegTrimmer::FfmpegTrimmer(const ProcessRunner& runner,
                             std::string ffmpeg,
                             std::shared_ptr<spdlog::logger> logger)
    : runner_(runner)
    , ffmpeg_(std::move(ffmpeg))
    , logger_(std::move(logger)) {}

void FfmpegTrimmer::trim(const std::filesystem::path& media,
                         double start_time,
                         double end_time,
                         const std::filesystem::path& output) {
    logger_->debug("Trimming {} [{:.3f}, {:.3f}] -> {}", media, start_time, end_time, output);

    const auto result = runner_.run({
        ffmpeg_, "-hide_banner", "-nostdin", "-y",
        "-ss", seconds_arg(start_time),
        "-to", seconds_arg(end_time),
        "-i", to_utf8(media),
        "-c", "copy",
        to_utf8(output)
    });

    if (!result.succeeded()) {
        logger_->error("Trimming {} failed with exit code {}", media, result.exit_code);
        throw AppError("Failed to trim clip.", result.output);
    }
}

// =============================================================================
// FfprobeProber
// =============================================================================

FfprobeProber::FfprobeProber(const ProcessRunner& runner,
                             std::string ffprobe,
                             std::shared_ptr<spdlog::logger> logger)
    : runner_(runner)
    , ffprobe_(std::move(ffprobe))
    , logger_(std::move(logger)) {}

MediaInfo FfprobeProber::probe(const std::filesystem::path& media) {
    const auto result = runner_.run({
        ffprobe_, "-v", "error",
        "-select_streams", "v:0",
        "-show_entries", "stream=width,height",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        to_utf8(media)
    });

    if (!result.succeeded()) {
        logger_->error("ffprobe on {} failed with exit code {}", media, result.exit_code);
        throw AppError("Cannot read video metadata.", result.output);
    }

    auto info = parse_probe_output(result.output);
    logger_->debug("Probed {}: {}x{}, {:.2f} s",
                   media, info.resolution.width, info.resolution.height, info.duration);
    return info;
}

MediaInfo parse_probe_output(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line) && lines.size() < 3) {
        line = trim_copy(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.size() < 3) {
        throw AppError("Cannot read video metadata.",
                       fmt::format("expected width, height and duration, got: {}", output));
    }

    MediaInfo info;
    if (!parse_number(lines[0], info.resolution.width) ||
        !parse_number(lines[1], info.resolution.height) ||
        !parse_number(lines[2], info.duration)) {
        throw AppError("Cannot read video metadata.",
                       fmt::format("non-numeric probe values: {} / {} / {}",
                                   lines[0], lines[1], lines[2]));
    }
    return info;
}

}  // namespace wms
