/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter and string helpers for std::filesystem::path
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Paths end up in log lines, error details, CSV rows and ffmpeg command
 * lines. All of those want UTF-8 text.
 *
 *   - C++20: u8string() returns std::u8string (char8_t), hence the cast
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   logger->info("Trimming {}", segment_path);   // Just works with fmt
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace wms {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Extension without the leading dot, lowercased ("Movie.MKV" -> "mkv")
 */
inline std::string extension_lower(const std::filesystem::path& path) {
    std::string ext = to_utf8(path.extension());
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace wms

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
