/**
 * @file    logging.hpp
 * @brief   Logger construction
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wms {

struct LoggingOptions {
    std::string name{"wmscan"};
    spdlog::level::level_enum level{spdlog::level::info};

    // When set, also log to <log_dir>/app.log, rotated daily, 7 files kept
    std::optional<std::filesystem::path> log_dir;
};

/**
 * Build a console logger (plus daily file sink when requested)
 *
 * The logger is registered with spdlog under options.name, replacing any
 * earlier logger of that name.
 *
 * @throws spdlog::spdlog_ex  log directory or file cannot be created
 */
std::shared_ptr<spdlog::logger> make_logger(const LoggingOptions& options);

/**
 * Logger that discards everything (tests, library callers without logging)
 */
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = "null");

}  // namespace wms
