/**
 * @file    ocr_aggregator.cpp
 * @brief   Per-ROI text recognition and confidence aggregation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/ocr_aggregator.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace wms {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_blank(std::string_view s) {
    return s.find_first_not_of(kWhitespace) == std::string_view::npos;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(first, last - first + 1));
}

bool fits_inside(const Roi& roi, const cv::Mat& frame) {
    if (roi.x < 0 || roi.y < 0 || roi.width <= 0 || roi.height <= 0) return false;
    return static_cast<std::int64_t>(roi.x) + roi.width <= frame.cols &&
           static_cast<std::int64_t>(roi.y) + roi.height <= frame.rows;
}

cv::Mat to_gray(const cv::Mat& region) {
    cv::Mat gray;
    if (region.channels() == 4) {
        cv::cvtColor(region, gray, cv::COLOR_BGRA2GRAY);
    } else if (region.channels() == 3) {
        cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = region.clone();
    }
    return gray;
}

}  // anonymous namespace

// =============================================================================
// Detection
// =============================================================================

Detection::Detection(VideoId video_id,
                     ClipId clip_id,
                     double timestamp,
                     std::string text,
                     double confidence,
                     Roi roi)
    : video_id_(video_id)
    , clip_id_(clip_id)
    , timestamp_(timestamp)
    , text_(std::move(text))
    , confidence_(confidence)
    , roi_(roi) {

    if (text_.empty()) {
        throw std::invalid_argument("Detection text must be non-empty");
    }
    if (!(confidence_ >= 0.0 && confidence_ <= 1.0)) {
        throw std::invalid_argument(
            fmt::format("Detection confidence must be between 0.0 and 1.0, got {}", confidence_));
    }
    if (timestamp_ < 0.0) {
        throw std::invalid_argument(
            fmt::format("Detection timestamp must be non-negative, got {}", timestamp_));
    }
}

Detection Detection::with_video_id(VideoId video_id) const {
    Detection copy = *this;
    copy.video_id_ = video_id;
    return copy;
}

void validate_confidence_threshold(double threshold) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument(
            fmt::format("confidence_threshold must be between 0.0 and 1.0, got {}", threshold));
    }
}

// =============================================================================
// OcrAggregator
// =============================================================================

OcrAggregator::OcrAggregator(TextRecognizer& engine, std::shared_ptr<spdlog::logger> logger)
    : engine_(engine)
    , logger_(std::move(logger)) {}

RoiOutcome OcrAggregator::evaluate_roi(const cv::Mat& frame,
                                       double timestamp,
                                       VideoId video_id,
                                       ClipId clip_id,
                                       const Roi& roi,
                                       double threshold) {
    RoiOutcome outcome;

    if (!fits_inside(roi, frame)) {
        logger_->warn("ROI ({},{} {}x{}) is out of frame bounds {}x{} and will be skipped",
                      roi.x, roi.y, roi.width, roi.height, frame.cols, frame.rows);
        outcome.reason = SkipReason::OutOfBounds;
        return outcome;
    }

    const cv::Mat region = frame(roi.to_rect());
    if (region.empty()) {
        logger_->warn("ROI ({},{} {}x{}) resulted in an empty crop and will be skipped",
                      roi.x, roi.y, roi.width, roi.height);
        outcome.reason = SkipReason::EmptyCrop;
        return outcome;
    }

    const cv::Mat gray = to_gray(region);

    std::vector<RecognizedToken> tokens;
    try {
        tokens = engine_.recognize(gray);
    } catch (const EngineUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        logger_->error("OCR engine error: {}", e.what());
        throw AppError("Error during OCR processing.", e.what());
    }

    // Mean runs over every token, including the ones dropped from the text
    double confidence_sum = 0.0;
    std::string joined;
    for (const auto& token : tokens) {
        const double confidence = std::min(token.confidence / 100.0, 1.0);
        confidence_sum += confidence;
        if (confidence > 0.0 && !is_blank(token.text)) {
            joined += token.text;
        }
    }

    outcome.token_count = tokens.size();
    outcome.text = trim(joined);
    outcome.confidence = tokens.empty() ? 0.0 : confidence_sum / static_cast<double>(tokens.size());

    if (outcome.text.empty()) {
        logger_->warn("No text recognized in ROI ({},{} {}x{}) at {:.3f}s",
                      roi.x, roi.y, roi.width, roi.height, timestamp);
        outcome.reason = SkipReason::NoText;
        return outcome;
    }

    if (outcome.confidence < threshold) {
        logger_->debug("'{}' at {:.3f}s below threshold ({:.3f} < {:.3f})",
                       outcome.text, timestamp, outcome.confidence, threshold);
        outcome.reason = SkipReason::BelowThreshold;
        return outcome;
    }

    outcome.status = RoiStatus::Accepted;
    outcome.detection.emplace(video_id, clip_id, timestamp, outcome.text, outcome.confidence, roi);
    logger_->debug("Accepted '{}' at {:.3f}s ({:.0f}%)",
                   outcome.text, timestamp, outcome.confidence * 100.0);
    return outcome;
}

bool OcrAggregator::recognize_into(std::vector<Detection>& out,
                                   const cv::Mat& frame,
                                   double timestamp,
                                   VideoId video_id,
                                   ClipId clip_id,
                                   const std::vector<Roi>& rois,
                                   double threshold,
                                   std::atomic<bool>* cancel_flag) {
    for (const auto& roi : rois) {
        if (cancel_flag && cancel_flag->load(std::memory_order_relaxed)) {
            return false;
        }

        RoiOutcome outcome = evaluate_roi(frame, timestamp, video_id, clip_id, roi, threshold);
        if (outcome.accepted()) {
            out.push_back(std::move(*outcome.detection));
        } else {
            logger_->trace("ROI ({},{} {}x{}) at {:.3f}s skipped: {}",
                           roi.x, roi.y, roi.width, roi.height, timestamp, to_string(outcome.reason));
        }
    }
    return true;
}

std::vector<Detection> OcrAggregator::recognize_frame(const cv::Mat& frame,
                                                      double timestamp,
                                                      VideoId video_id,
                                                      ClipId clip_id,
                                                      const std::vector<Roi>& rois,
                                                      double threshold) {
    validate_confidence_threshold(threshold);

    std::vector<Detection> detections;
    recognize_into(detections, frame, timestamp, video_id, clip_id, rois, threshold, nullptr);
    return detections;
}

std::vector<Detection> OcrAggregator::recognize_batch(const FrameBatch& batch,
                                                      const std::vector<Roi>& rois,
                                                      double threshold,
                                                      std::atomic<bool>* cancel_flag) {
    validate_confidence_threshold(threshold);
    if (batch.frames.size() != batch.timestamps.size()) {
        throw std::invalid_argument(
            fmt::format("Frame batch has {} frames but {} timestamps",
                        batch.frames.size(), batch.timestamps.size()));
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<Detection> detections;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const bool completed = recognize_into(detections, batch.frames[i], batch.timestamps[i],
                                              batch.clip_id, batch.clip_id,
                                              rois, threshold, cancel_flag);
        if (!completed) {
            logger_->info("OCR cancelled after {} of {} frames", i, batch.size());
            break;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_->info("OCR on clip {}: {} frames x {} ROIs -> {} detections in {} ms",
                  batch.clip_id, batch.size(), rois.size(), detections.size(), elapsed);

    return detections;
}

}  // namespace wms
