/**
 * @file    roi_store.cpp
 * @brief   Regions of interest used for text recognition
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/roi_store.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace wms {

namespace {

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // anonymous namespace

void validate_roi(const Roi& roi) {
    if (roi.x < 0 || roi.y < 0) {
        throw std::invalid_argument(
            fmt::format("ROI x and y must be non-negative (got {}, {})", roi.x, roi.y));
    }
    if (roi.width <= 0 || roi.height <= 0) {
        throw std::invalid_argument(
            fmt::format("ROI width and height must be positive (got {}x{})", roi.width, roi.height));
    }
}

Roi parse_roi(const std::string& text) {
    std::array<int, 4> values{};
    std::string_view rest(text);

    for (std::size_t i = 0; i < values.size(); ++i) {
        const auto comma = rest.find(',');
        const bool last = (i + 1 == values.size());
        if (last != (comma == std::string_view::npos)) {
            throw std::invalid_argument(
                fmt::format("ROI '{}' must have the form x,y,width,height", text));
        }

        const std::string_view field = trim_view(rest.substr(0, comma));
        const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), values[i]);
        if (field.empty() || ec != std::errc{} || ptr != field.data() + field.size()) {
            throw std::invalid_argument(
                fmt::format("ROI '{}' contains a non-integer field '{}'", text, field));
        }

        if (!last) rest.remove_prefix(comma + 1);
    }

    return Roi{values[0], values[1], values[2], values[3]};
}

RoiStore::RoiStore(const std::vector<Roi>& initial) {
    rois_.reserve(initial.size());
    for (const auto& roi : initial) {
        add(roi);
    }
}

void RoiStore::add(const Roi& roi) {
    validate_roi(roi);
    rois_.push_back(roi);
}

void RoiStore::remove(std::size_t index) {
    if (index >= rois_.size()) {
        throw std::out_of_range(
            fmt::format("ROI index {} out of range (size {})", index, rois_.size()));
    }
    rois_.erase(rois_.begin() + static_cast<std::ptrdiff_t>(index));
}

}  // namespace wms
