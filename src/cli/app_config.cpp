/**
 * @file    app_config.cpp
 * @brief   Scanner settings bound to command-line and config-file options
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "cli/app_config.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace wms {

namespace {

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

template<typename T>
T parse_number(const std::string& raw, const char* what) {
    const std::string text = trimmed(raw);
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, raw));
    }
    return value;
}

}  // anonymous namespace

std::string AppConfig::default_work_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return to_utf8(tmp / "wmscan");
}

void add_config_options(CLI::App& app, AppConfig& config) {
    app.set_config("--config", "", "Read settings from a TOML/INI file");

    app.add_option("-t,--threshold", config.confidence_threshold,
        "Minimum OCR confidence to accept a detection")
        ->capture_default_str()
        ->check(CLI::Range(0.0, 1.0));

    app.add_option("--fps", config.fps, "Frames sampled per second of video")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);

    app.add_option("--scene-threshold", config.scene_threshold,
        "Scene change score that starts a new clip, in (0, 1)")
        ->capture_default_str();

    app.add_option_function<std::vector<std::string>>("--roi",
        [&config](const std::vector<std::string>& specs) {
            std::vector<Roi> rois;
            for (const auto& spec : specs) {
                try {
                    Roi roi = parse_roi(spec);
                    validate_roi(roi);
                    rois.push_back(roi);
                } catch (const std::invalid_argument& e) {
                    throw CLI::ValidationError("--roi", e.what());
                }
            }
            config.rois = std::move(rois);
        },
        "Search region x,y,width,height (repeatable, replaces the defaults)");

    app.add_option("--formats", config.formats, "Accepted file extensions")
        ->capture_default_str();

    app.add_option("--work-dir", config.work_dir, "Directory for clip segments and downloads")
        ->capture_default_str();

    app.add_option("--ffmpeg", config.ffmpeg, "ffmpeg executable")->capture_default_str();
    app.add_option("--ffprobe", config.ffprobe, "ffprobe executable")->capture_default_str();
    app.add_option("--yt-dlp", config.downloader, "yt-dlp executable")->capture_default_str();

    app.add_option("--tool-timeout", config.tool_timeout,
        "Seconds an external tool may run, 0 = unlimited")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);

    app.add_option("--lang", config.language, "Tesseract language")->capture_default_str();

    app.add_option("--log-dir", config.log_dir, "Also write a daily log file to this directory");
}

void add_query_options(CLI::App& app, DetectionQuery& query) {
    app.add_option_function<std::string>("--filter-text",
        [&query](const std::string& text) { query.text = text; },
        "Keep detections whose text contains this (case-insensitive)");

    app.add_option_function<double>("--min-confidence",
        [&query](double value) { query.min_confidence = value; },
        "Keep detections at or above this confidence")
        ->check(CLI::Range(0.0, 1.0));

    app.add_option_function<ClipId>("--filter-clip",
        [&query](ClipId id) { query.clip_id = id; },
        "Keep detections of one clip id")
        ->check(CLI::PositiveNumber);
}

void validate_config(const AppConfig& config) {
    if (!(config.confidence_threshold >= 0.0 && config.confidence_threshold <= 1.0)) {
        throw std::invalid_argument(
            fmt::format("threshold must be in [0, 1], got {}", config.confidence_threshold));
    }
    if (!(config.fps > 0.0)) {
        throw std::invalid_argument(fmt::format("fps must be greater than 0, got {}", config.fps));
    }
    if (!(config.scene_threshold > 0.0 && config.scene_threshold < 1.0)) {
        throw std::invalid_argument(
            fmt::format("scene-threshold must be in (0, 1), got {}", config.scene_threshold));
    }

    if (config.rois.empty()) {
        throw std::invalid_argument("roi: at least one region is required");
    }
    for (const auto& roi : config.rois) {
        try {
            validate_roi(roi);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(fmt::format("roi: {}", e.what()));
        }
    }

    if (config.formats.empty()) {
        throw std::invalid_argument("formats: at least one extension is required");
    }
    for (const auto& fmt_name : config.formats) {
        const bool has_upper = std::any_of(fmt_name.begin(), fmt_name.end(),
                                           [](unsigned char c) { return std::isupper(c) != 0; });
        if (fmt_name.empty() || fmt_name.front() == '.' || has_upper) {
            throw std::invalid_argument(
                fmt::format("formats: '{}' must be lowercase without leading dot", fmt_name));
        }
    }

    if (config.work_dir.empty()) {
        throw std::invalid_argument("work-dir must not be empty");
    }
    if (config.ffmpeg.empty() || config.ffprobe.empty() || config.downloader.empty()) {
        throw std::invalid_argument("ffmpeg, ffprobe and yt-dlp must name an executable");
    }
    if (config.tool_timeout < 0) {
        throw std::invalid_argument(
            fmt::format("tool-timeout must not be negative, got {}", config.tool_timeout));
    }
    if (config.language.empty()) {
        throw std::invalid_argument("lang must not be empty");
    }
}

std::vector<ClipId> parse_clip_ids(const std::string& text) {
    std::vector<ClipId> ids;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const auto comma = text.find(',', pos);
        const auto end = (comma == std::string::npos) ? text.size() : comma;
        ids.push_back(parse_number<ClipId>(text.substr(pos, end - pos), "clip id"));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return ids;
}

std::pair<ClipId, double> parse_split_request(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument(fmt::format("Split request '{}' must be <clip id>:<seconds>", text));
    }
    return {
        parse_number<ClipId>(text.substr(0, colon), "clip id"),
        parse_number<double>(text.substr(colon + 1), "split time")
    };
}

}  // namespace wms
