/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line interface for the video watermark scanner.
 * Imports one video (file or URL), splits it into scene clips, applies
 * optional merge/split edits, then samples and recognizes every clip.
 */

#include "cli/cli_app.hpp"
#include "cli/app_config.hpp"
#include "core/clip_timeline.hpp"
#include "core/errors.hpp"
#include "core/frame_sampler.hpp"
#include "core/ocr_aggregator.hpp"
#include "core/roi_store.hpp"
#include "media/ffmpeg_tools.hpp"
#include "media/process_runner.hpp"
#include "media/video_capture_source.hpp"
#include "media/video_importer.hpp"
#include "ocr/tesseract_recognizer.hpp"
#include "storage/detection_repository.hpp"
#include "utils/ascii_logo.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/color.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace wms::cli {

namespace {

// Set by SIGINT; the pipeline stops between frames and keeps what it has
std::atomic<bool> g_cancel{false};

void on_interrupt(int) {
    g_cancel.store(true);
}

// =============================================================================
// Banner printing
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "{}", ASCII_BANNER);
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", WMS_VERSION);
    fmt::print(fmt::fg(fmt::color::yellow), "  *** Video Text Watermark Scanner ***\n");
    fmt::print("\n");
}

// =============================================================================
// Request / pipeline helpers
// =============================================================================

struct ScanRequest {
    std::string input_path;
    std::string url;
    std::string output_path;
    bool list_clips = false;
    std::vector<std::string> merges;
    std::vector<std::string> splits;
    DetectionQuery filter;
};

void register_clip(ClipTimeline& timeline, DetectionRepository& repo, ClipKey key) {
    const ClipId id = repo.add_clip(timeline.at(key));
    timeline.assign_id(key, id);
}

// Replaced clips leave the repository; the timeline holds the working set
void retire_clips(DetectionRepository& repo, const std::vector<ClipId>& ids) {
    for (ClipId id : ids) {
        repo.remove_clip(id);
    }
}

void print_clips(const ClipTimeline& timeline, VideoId video_id) {
    const auto clips = timeline.clips(video_id);
    fmt::print(fmt::fg(fmt::color::cyan), "\nClips ({})\n", clips.size());
    for (const auto& clip : clips) {
        fmt::print("  #{:<4} {:>10.3f} - {:<10.3f} ({:.3f} s)\n",
                   clip.id, clip.start_time, clip.end_time, clip.duration());
    }
    fmt::print("\n");
}

void print_summary(const DetectionRepository& repo,
                   const std::vector<StoredDetection>& rows,
                   std::size_t clip_count) {
    std::map<std::string, std::size_t> by_text;
    std::map<ClipId, std::size_t> by_clip;
    for (const auto& row : rows) {
        by_text[row.detection.text()]++;
        by_clip[row.detection.clip_id()]++;
    }

    fmt::print(fmt::fg(fmt::color::green), "\n[OK] Scanned {} clips: {} detections", clip_count, rows.size());
    fmt::print("\n");
    for (const auto& [text, count] : by_text) {
        fmt::print("  {:>5} x  {}\n", count, text);
    }

    for (const auto& [clip_id, count] : by_clip) {
        if (auto clip = repo.find_clip(clip_id)) {
            fmt::print("  clip #{:<4} [{:.3f}, {:.3f})  {} detections\n",
                       clip_id, clip->start_time, clip->end_time, count);
        }
    }
}

int run_scan(const ScanRequest& request, const AppConfig& config, std::shared_ptr<spdlog::logger> logger) {
    auto start = std::chrono::steady_clock::now();

    ProcessRunner runner(std::chrono::seconds(config.tool_timeout), logger, &g_cancel);

    // Import
    FfprobeProber prober(runner, config.ffprobe, logger);
    VideoImporter importer(prober, runner,
                           ImportOptions{config.formats, config.downloader, fs::path(config.work_dir)},
                           logger);

    Video imported = request.url.empty()
        ? importer.import_from_file(fs::path(request.input_path))
        : importer.import_from_url(request.url);

    InMemoryDetectionRepository repo;
    const VideoId video_id = repo.add_video(imported);
    const Video video = repo.find_video(video_id).value();
    fmt::print(fmt::fg(fmt::color::cyan), "Video #{} ({}): {}\n",
               video.id(), to_string(video.source_kind()), video.source_path());

    // Clips
    FfmpegSceneDetector detector(runner, config.ffmpeg, logger);
    ClipTimeline timeline(detector, logger);

    for (ClipKey key : timeline.detect(video, config.scene_threshold)) {
        register_clip(timeline, repo, key);
    }

    for (const auto& merge : request.merges) {
        const auto ids = parse_clip_ids(merge);
        const ClipKey key = timeline.merge(ids);
        retire_clips(repo, ids);
        register_clip(timeline, repo, key);
        logger->info("Merged clips {} into #{}", merge, timeline.at(key).id);
    }

    for (const auto& split : request.splits) {
        const auto [clip_id, split_time] = parse_split_request(split);
        const auto [first, second] = timeline.split(clip_id, split_time);
        retire_clips(repo, {clip_id});
        register_clip(timeline, repo, first);
        register_clip(timeline, repo, second);
        logger->info("Split clip #{} at {:.3f} s into #{} and #{}",
                     clip_id, split_time, timeline.at(first).id, timeline.at(second).id);
    }

    if (request.list_clips) {
        print_clips(timeline, video.id());
        return 0;
    }

    if (request.filter.clip_id && !repo.find_clip(*request.filter.clip_id)) {
        throw AppError("Unknown clip for --filter-clip.",
                       fmt::format("clip #{} is not in the current clip list", *request.filter.clip_id));
    }

    // Sampling + recognition
    RoiStore rois(config.rois);
    TesseractRecognizer recognizer(config.language, logger);
    OcrAggregator aggregator(recognizer, logger);

    FfmpegTrimmer trimmer(runner, config.ffmpeg, logger);
    VideoCaptureSourceFactory sources;
    FrameSampler sampler(trimmer, sources, fs::path(config.work_dir), logger);

    const auto keys = timeline.keys(video.id());
    std::size_t scanned = 0;
    for (ClipKey key : keys) {
        if (g_cancel.load()) break;

        Clip& clip = timeline.at(key);
        logger->info("Clip #{} [{:.3f}, {:.3f})", clip.id, clip.start_time, clip.end_time);

        FrameBatch batch;
        try {
            batch = sampler.extract(clip, video, config.fps, &g_cancel);
        } catch (const InterruptedError& e) {
            // Keep what the earlier clips produced
            logger->debug("Trim interrupted: {}", e.detail());
            break;
        }
        repo.update_clip(clip);
        auto detections = aggregator.recognize_batch(batch, rois.list(), config.confidence_threshold, &g_cancel);

        // Batch results carry the clip id in place of the video id
        for (const auto& detection : detections) {
            repo.add_detection(detection.with_video_id(video.id()));
        }
        ++scanned;
    }

    if (g_cancel.load()) {
        logger->warn("Interrupted, {} of {} clips scanned", scanned, keys.size());
    }

    const auto rows = repo.query(request.filter);
    print_summary(repo, rows, scanned);

    if (!request.output_path.empty()) {
        export_csv(rows, fs::path(request.output_path));
        fmt::print(fmt::fg(fmt::color::green), "[OK] Saved: {}\n", request.output_path);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger->info("Finished in {} ms", elapsed);

    return g_cancel.load() ? 1 : 0;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    CLI::App app{"wmscan - Locate text watermarks in video"};
    app.footer("\nExample: wmscan -i movie.mp4 --roi 0,0,320,80 -o detections.csv");
    print_banner();

    app.set_version_flag("-V,--version", WMS_VERSION);

    ScanRequest request;
    AppConfig config;

    // Source
    auto* input_opt = app.add_option("-i,--input", request.input_path, "Input video file")
        ->check(CLI::ExistingFile);
    auto* url_opt = app.add_option("--url", request.url, "Download the video from a URL");
    input_opt->excludes(url_opt);

    app.add_option("-o,--output", request.output_path, "Export detections to CSV");

    // Clip edits
    app.add_flag("--list-clips", request.list_clips, "Print the clips (after edits) and exit");
    app.add_option("--merge", request.merges, "Merge clips, ascending ids \"2,3,4\" (repeatable)");
    app.add_option("--split", request.splits, "Split a clip, \"<id>:<seconds>\" (repeatable)");

    add_config_options(app, config);
    add_query_options(app, request.filter);

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    if (request.input_path.empty() && request.url.empty()) {
        fmt::print(fmt::fg(fmt::color::red), "One of --input or --url is required\n");
        fmt::print("{}", app.help());
        return 1;
    }

    // Configure logging
    LoggingOptions log_options;
    if (quiet) {
        log_options.level = spdlog::level::err;
    } else if (verbose) {
        log_options.level = spdlog::level::debug;
    }
    if (!config.log_dir.empty()) {
        log_options.log_dir = fs::path(config.log_dir);
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = make_logger(log_options);
    } catch (const spdlog::spdlog_ex& e) {
        fmt::print(fmt::fg(fmt::color::red), "Cannot set up logging: {}\n", e.what());
        return 1;
    }
    spdlog::set_default_logger(logger);

    std::signal(SIGINT, on_interrupt);

    try {
        validate_config(config);
        return run_scan(request, config, logger);
    } catch (const EngineUnavailableError& e) {
        logger->critical("{}", e.what());
        fmt::print(fmt::fg(fmt::color::red), "[FATAL] OCR engine not available. Install Tesseract and its language data.\n");
        return 1;
    } catch (const InterruptedError& e) {
        logger->warn("Interrupted: {}", e.detail());
        fmt::print(fmt::fg(fmt::color::yellow), "[INTERRUPTED] Stopped before the scan finished.\n");
        return 1;
    } catch (const AppError& e) {
        logger->error("{} {}", e.user_message(), e.detail());
        fmt::print(fmt::fg(fmt::color::red), "[ERROR] {}\n", e.user_message());
        return 1;
    } catch (const std::exception& e) {
        logger->error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace wms::cli
