/**
 * @file    video_importer.hpp
 * @brief   Import of local files and downloaded URLs as Video records
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/media_tools.hpp"
#include "core/video.hpp"
#include "media/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wms {

struct ImportOptions {
    // Accepted extensions, lowercase without dot
    std::vector<std::string> formats{"mp4", "avi", "mov", "mkv"};

    std::string downloader{"yt-dlp"};

    // Parent of per-download directories
    std::filesystem::path work_dir;
};

class VideoImporter {
public:
    // yt-dlp format selector, mp4 preferred so the result is a single .mp4
    static constexpr const char* kDownloadFormat = "bestvideo[ext=mp4]+bestaudio/best[ext=mp4]/best";

    VideoImporter(Prober& prober,
                  const ProcessRunner& runner,
                  ImportOptions options,
                  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Import a local video file
     *
     * @throws AppError  missing file, unsupported extension or probe failure
     */
    [[nodiscard]] Video import_from_file(const std::filesystem::path& path);

    /**
     * Download a video and import the resulting file
     *
     * @param download_dir  Target directory; a fresh directory under the
     *                      work dir when not given
     *
     * @throws AppError  download failure, no single .mp4 in the download
     *                   directory, or probe failure
     */
    [[nodiscard]] Video import_from_url(const std::string& url,
                                        std::optional<std::filesystem::path> download_dir = std::nullopt);

    [[nodiscard]] bool is_supported(const std::filesystem::path& path) const;

private:
    std::filesystem::path make_download_dir() const;

    Prober& prober_;
    const ProcessRunner& runner_;
    ImportOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wms
