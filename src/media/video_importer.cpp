/**
 * @file    video_importer.cpp
 * @brief   Import of local files and downloaded URLs as Video records
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "media/video_importer.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace wms {

VideoImporter::VideoImporter(Prober& prober,
                             const ProcessRunner& runner,
                             ImportOptions options,
                             std::shared_ptr<spdlog::logger> logger)
    : prober_(prober)
    , runner_(runner)
    , options_(std::move(options))
    , logger_(std::move(logger)) {}

bool VideoImporter::is_supported(const fs::path& path) const {
    const std::string ext = extension_lower(path);
    return std::find(options_.formats.begin(), options_.formats.end(), ext) != options_.formats.end();
}

Video VideoImporter::import_from_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        logger_->error("File not found: {}", path);
        throw AppError("File not found.", to_utf8(path));
    }

    if (!is_supported(path)) {
        logger_->error("Unsupported file format: {}", path);
        throw AppError("Unsupported file format.", extension_lower(path));
    }

    const MediaInfo info = prober_.probe(path);
    const fs::path absolute = fs::absolute(path);

    logger_->info("Imported {} ({}x{}, {:.2f} s)",
                  absolute, info.resolution.width, info.resolution.height, info.duration);

    return Video(SourceKind::File, absolute, std::nullopt,
                 info.duration, info.resolution, utc_timestamp_now());
}

fs::path VideoImporter::make_download_dir() const {
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return options_.work_dir / fmt::format("download_{}", stamp);
}

Video VideoImporter::import_from_url(const std::string& url, std::optional<fs::path> download_dir) {
    const fs::path dir = download_dir ? *download_dir : make_download_dir();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        logger_->error("Cannot create download directory {}: {}", dir, ec.message());
        throw AppError("Cannot download video from URL.", ec.message());
    }

    logger_->info("Downloading {} into {}", url, dir);

    const auto result = runner_.run({
        options_.downloader,
        "--no-progress", "--no-playlist",
        "-f", kDownloadFormat,
        "-o", to_utf8(dir / "%(title)s.%(ext)s"),
        url
    });

    if (!result.succeeded()) {
        logger_->error("{} exited with {}", options_.downloader, result.exit_code);
        throw AppError("Cannot download video from URL.", result.output);
    }

    std::vector<fs::path> downloaded;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && extension_lower(entry.path()) == "mp4") {
            downloaded.push_back(entry.path());
        }
    }
    if (ec || downloaded.size() != 1) {
        const std::string msg = fmt::format("Expected one mp4 file, found {}", downloaded.size());
        logger_->error(msg);
        throw AppError("Downloaded file not found or ambiguous.", msg);
    }

    const MediaInfo info = prober_.probe(downloaded.front());
    const fs::path absolute = fs::absolute(downloaded.front());

    logger_->info("Imported {} from {} ({}x{}, {:.2f} s)",
                  absolute.filename(), url,
                  info.resolution.width, info.resolution.height, info.duration);

    return Video(SourceKind::Url, absolute, url,
                 info.duration, info.resolution, utc_timestamp_now());
}

}  // namespace wms
