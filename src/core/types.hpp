/**
 * @file    types.hpp
 * @brief   Shared type definitions for the video watermark scanner
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace wms {

// Record identities are assigned by the persistence layer
using VideoId = std::int64_t;
using ClipId = std::int64_t;
using DetectionId = std::int64_t;

// Identity of a record that has not been persisted yet
inline constexpr std::int64_t kUnassignedId = -1;

[[nodiscard]] constexpr bool is_assigned(std::int64_t id) noexcept {
    return id != kUnassignedId;
}

// Where an imported video came from
enum class SourceKind {
    File,
    Url
};

[[nodiscard]] constexpr std::string_view to_string(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::File: return "file";
        case SourceKind::Url:  return "url";
        default:               return "unknown";
    }
}

}  // namespace wms
