/**
 * @file    logging.cpp
 * @brief   Logger construction
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdint>
#include <system_error>
#include <vector>

namespace wms {

namespace {

constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
constexpr std::uint16_t kKeptLogFiles = 7;

}  // anonymous namespace

std::shared_ptr<spdlog::logger> make_logger(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (options.log_dir) {
        std::error_code ec;
        std::filesystem::create_directories(*options.log_dir, ec);
        if (ec) {
            throw spdlog::spdlog_ex(
                fmt::format("Cannot create log directory {}: {}", *options.log_dir, ec.message()));
        }

        // Rotates at midnight
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            to_utf8(*options.log_dir / "app.log"), 0, 0, false, kKeptLogFiles);
        file_sink->set_pattern(kFilePattern);
        sinks.push_back(std::move(file_sink));
    }

    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
    logger->set_level(options.level);

    spdlog::drop(options.name);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace wms
