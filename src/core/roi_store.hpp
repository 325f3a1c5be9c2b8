/**
 * @file    roi_store.hpp
 * @brief   Regions of interest used for text recognition
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace wms {

/**
 * Rectangular search region in frame pixel coordinates
 */
struct Roi {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    [[nodiscard]] cv::Rect to_rect() const noexcept { return {x, y, width, height}; }

    bool operator==(const Roi& other) const noexcept = default;
};

/**
 * Check ROI geometry
 *
 * @throws std::invalid_argument  x or y negative, width or height not positive
 */
void validate_roi(const Roi& roi);

/**
 * Parse "x,y,width,height" (whitespace around numbers allowed)
 *
 * Only the syntax is checked here; geometry is checked by validate_roi().
 *
 * @throws std::invalid_argument  malformed text
 */
[[nodiscard]] Roi parse_roi(const std::string& text);

/**
 * Ordered list of ROIs
 */
class RoiStore {
public:
    RoiStore() = default;

    /**
     * Seed the store, validating each ROI as add() does
     */
    explicit RoiStore(const std::vector<Roi>& initial);

    /**
     * Append a region
     *
     * @throws std::invalid_argument  see validate_roi()
     */
    void add(const Roi& roi);

    /**
     * Remove the region at index
     *
     * @throws std::out_of_range  index >= size()
     */
    void remove(std::size_t index);

    // Independent copy, in insertion order
    [[nodiscard]] std::vector<Roi> list() const { return rois_; }

    [[nodiscard]] std::size_t size() const noexcept { return rois_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rois_.empty(); }

private:
    std::vector<Roi> rois_;
};

}  // namespace wms
