/**
 * @file    ocr_aggregator.hpp
 * @brief   Per-ROI text recognition and confidence aggregation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * For every ROI of every sampled frame:
 *   1. Crop the ROI (skipped when it does not fit the frame)
 *   2. Convert to grayscale and run the recognition engine
 *   3. Normalize token confidences from percent to [0, 1]
 *   4. Text = positive-confidence, non-blank tokens joined without
 *      separator, then trimmed
 *   5. Confidence = mean over ALL returned tokens (0 when none)
 *   6. Accept when text is non-empty and confidence >= threshold
 */

#pragma once

#include "core/frame_sampler.hpp"
#include "core/roi_store.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wms {

/**
 * Accepted watermark text found in one ROI of one frame
 *
 * Immutable; the constructor enforces the value ranges.
 */
class Detection {
public:
    /**
     * @throws std::invalid_argument  empty text, negative timestamp or
     *                                confidence outside [0, 1]
     */
    Detection(VideoId video_id,
              ClipId clip_id,
              double timestamp,
              std::string text,
              double confidence,
              Roi roi);

    [[nodiscard]] VideoId video_id() const noexcept { return video_id_; }
    [[nodiscard]] ClipId clip_id() const noexcept { return clip_id_; }
    [[nodiscard]] double timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] double confidence() const noexcept { return confidence_; }
    [[nodiscard]] const Roi& roi() const noexcept { return roi_; }

    // Copy attributed to another video (batch results carry the clip id there)
    [[nodiscard]] Detection with_video_id(VideoId video_id) const;

private:
    VideoId video_id_;
    ClipId clip_id_;
    double timestamp_;
    std::string text_;
    double confidence_;
    Roi roi_;
};

/**
 * One token reported by the recognition engine
 */
struct RecognizedToken {
    std::string text;
    double confidence{0.0};  // Raw engine score, 0 - 100 (negative = no score)
};

/**
 * Text recognition engine
 *
 * recognize() takes a single-channel 8-bit image and returns tokens in
 * reading order.
 *
 * @throws EngineUnavailableError  the runtime is missing
 * @throws std::exception          any other engine fault
 */
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    virtual std::vector<RecognizedToken> recognize(const cv::Mat& gray) = 0;
};

/**
 * Per-ROI decision
 */
enum class RoiStatus {
    Accepted,
    Skipped
};

enum class SkipReason {
    None,
    OutOfBounds,     // ROI does not fit inside the frame
    EmptyCrop,       // Crop has no pixels
    NoText,          // Engine returned no usable text
    BelowThreshold   // Text found, confidence too low
};

[[nodiscard]] constexpr std::string_view to_string(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::None:           return "none";
        case SkipReason::OutOfBounds:    return "out of bounds";
        case SkipReason::EmptyCrop:      return "empty crop";
        case SkipReason::NoText:         return "no text";
        case SkipReason::BelowThreshold: return "below threshold";
        default:                         return "unknown";
    }
}

/**
 * Result of evaluating one ROI
 */
struct RoiOutcome {
    RoiStatus status{RoiStatus::Skipped};
    SkipReason reason{SkipReason::None};
    std::optional<Detection> detection;  // Set when Accepted

    // Aggregated values (also filled for NoText / BelowThreshold)
    std::string text;
    double confidence{0.0};
    std::size_t token_count{0};

    [[nodiscard]] bool accepted() const noexcept { return status == RoiStatus::Accepted; }
};

class OcrAggregator {
public:
    /**
     * @param engine  Recognition engine (must outlive the aggregator)
     * @param logger  Log sink
     */
    explicit OcrAggregator(TextRecognizer& engine,
                           std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Evaluate a single ROI of a frame
     *
     * The threshold is not validated here; recognize_frame() and
     * recognize_batch() do that before any engine call.
     *
     * @throws EngineUnavailableError  recognition runtime missing
     * @throws AppError                any other engine failure
     */
    RoiOutcome evaluate_roi(const cv::Mat& frame,
                            double timestamp,
                            VideoId video_id,
                            ClipId clip_id,
                            const Roi& roi,
                            double threshold);

    /**
     * Recognize all ROIs of one frame
     *
     * @return  Accepted detections in ROI order
     *
     * @throws std::invalid_argument   threshold outside [0, 1]
     * @throws EngineUnavailableError  recognition runtime missing
     * @throws AppError                any other engine failure
     */
    std::vector<Detection> recognize_frame(const cv::Mat& frame,
                                           double timestamp,
                                           VideoId video_id,
                                           ClipId clip_id,
                                           const std::vector<Roi>& rois,
                                           double threshold);

    /**
     * Recognize every frame of a batch, in frame order
     *
     * The batch's clip id is used as BOTH video id and clip id of every
     * detection. Callers that know the video must re-attribute the results
     * (Detection::with_video_id()).
     *
     * @param cancel_flag  Optional, checked between ROIs; when set the
     *                     detections found so far are returned
     *
     * @throws std::invalid_argument   threshold outside [0, 1] or a batch
     *                                 whose frame and timestamp counts differ
     * @throws EngineUnavailableError  recognition runtime missing
     * @throws AppError                any other engine failure
     */
    std::vector<Detection> recognize_batch(const FrameBatch& batch,
                                           const std::vector<Roi>& rois,
                                           double threshold,
                                           std::atomic<bool>* cancel_flag = nullptr);

private:
    bool recognize_into(std::vector<Detection>& out,
                        const cv::Mat& frame,
                        double timestamp,
                        VideoId video_id,
                        ClipId clip_id,
                        const std::vector<Roi>& rois,
                        double threshold,
                        std::atomic<bool>* cancel_flag);

    TextRecognizer& engine_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @throws std::invalid_argument  threshold outside [0, 1]
 */
void validate_confidence_threshold(double threshold);

}  // namespace wms
