/**
 * @file    tesseract_recognizer.hpp
 * @brief   Tesseract backed text recognizer
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/ocr_aggregator.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wms {

/**
 * Word-level recognition with tesseract::TessBaseAPI (LSTM engine)
 *
 * The engine is initialized on the first recognize() call. TessBaseAPI is
 * not thread-safe, so calls are serialized.
 */
class TesseractRecognizer : public TextRecognizer {
public:
    /**
     * @param language  Traineddata name ("eng", "eng+chi_tra", ...)
     * @param logger    Log sink
     */
    explicit TesseractRecognizer(std::string language = "eng",
                                 std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~TesseractRecognizer() override;

    TesseractRecognizer(const TesseractRecognizer&) = delete;
    TesseractRecognizer& operator=(const TesseractRecognizer&) = delete;

    /**
     * @param gray  CV_8UC1 image
     * @return      One token per recognized word, confidence 0 - 100
     *
     * @throws EngineUnavailableError  Tesseract or its language data missing
     * @throws std::invalid_argument   image is not single-channel 8-bit
     */
    std::vector<RecognizedToken> recognize(const cv::Mat& gray) override;

    [[nodiscard]] const std::string& language() const noexcept { return language_; }

private:
    void ensure_initialized();

    struct TessImpl;

    std::string language_;
    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    std::unique_ptr<TessImpl> tess_;
};

}  // namespace wms
