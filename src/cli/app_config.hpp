/**
 * @file    app_config.hpp
 * @brief   Scanner settings bound to command-line and config-file options
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Every setting can be given on the command line or in a TOML/INI file
 * passed with --config (command line wins):
 *
 *   threshold = 0.8
 *   fps = 2.0
 *   roi = ["10,10,200,50", "10,300,200,50"]
 *   formats = ["mp4", "mkv"]
 *   log-dir = "/var/log/wmscan"
 */

#pragma once

#include "core/roi_store.hpp"
#include "core/types.hpp"
#include "storage/detection_repository.hpp"

#include <CLI/CLI.hpp>

#include <string>
#include <utility>
#include <vector>

namespace wms {

struct AppConfig {
    double confidence_threshold{0.75};   // [0, 1]
    double fps{1.0};                     // > 0
    double scene_threshold{0.4};         // (0, 1)

    std::vector<Roi> rois{
        {10, 10, 200, 50},
        {10, 300, 200, 50}
    };

    // Accepted input extensions, lowercase without dot
    std::vector<std::string> formats{"mp4", "avi", "mov", "mkv"};

    std::string work_dir{default_work_dir()};

    std::string ffmpeg{"ffmpeg"};
    std::string ffprobe{"ffprobe"};
    std::string downloader{"yt-dlp"};
    int tool_timeout{600};               // Seconds, 0 = unlimited

    std::string language{"eng"};         // Tesseract traineddata

    std::string log_dir;                 // Empty = console only

    // <system temp>/wmscan
    [[nodiscard]] static std::string default_work_dir();
};

/**
 * Register all AppConfig options (and --config) on a CLI11 app
 *
 * The config object must outlive parsing.
 */
void add_config_options(CLI::App& app, AppConfig& config);

/**
 * Register the detection filters applied to the summary and CSV export:
 * --filter-text, --min-confidence, --filter-clip
 */
void add_query_options(CLI::App& app, DetectionQuery& query);

/**
 * @throws std::invalid_argument  message names the offending setting
 */
void validate_config(const AppConfig& config);

/**
 * Parse a merge selection "3,4,5"
 *
 * @throws std::invalid_argument  empty list or non-integer entry
 */
[[nodiscard]] std::vector<ClipId> parse_clip_ids(const std::string& text);

/**
 * Parse a split request "<clip id>:<seconds>"
 *
 * @throws std::invalid_argument  malformed request
 */
[[nodiscard]] std::pair<ClipId, double> parse_split_request(const std::string& text);

}  // namespace wms
