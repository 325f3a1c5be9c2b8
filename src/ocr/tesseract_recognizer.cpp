/**
 * @file    tesseract_recognizer.cpp
 * @brief   Tesseract backed text recognizer
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "ocr/tesseract_recognizer.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <stdexcept>

namespace wms {

struct TesseractRecognizer::TessImpl {
    tesseract::TessBaseAPI api;
    bool initialized{false};

    ~TessImpl() {
        if (initialized) {
            api.End();
        }
    }
};

TesseractRecognizer::TesseractRecognizer(std::string language, std::shared_ptr<spdlog::logger> logger)
    : language_(std::move(language))
    , logger_(std::move(logger))
    , tess_(std::make_unique<TessImpl>()) {}

TesseractRecognizer::~TesseractRecognizer() = default;

void TesseractRecognizer::ensure_initialized() {
    if (tess_->initialized) return;

    // Init returns non-zero when the library cannot find its language data
    if (tess_->api.Init(nullptr, language_.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        logger_->critical("Tesseract initialization failed for language '{}'", language_);
        throw EngineUnavailableError(
            fmt::format("Tesseract OCR is not available (language '{}')", language_));
    }
    tess_->api.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    tess_->initialized = true;

    logger_->debug("Tesseract {} initialized ({})", tesseract::TessBaseAPI::Version(), language_);
}

std::vector<RecognizedToken> TesseractRecognizer::recognize(const cv::Mat& gray) {
    if (gray.type() != CV_8UC1) {
        throw std::invalid_argument("Recognizer expects a single-channel 8-bit image");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_initialized();

    tesseract::TessBaseAPI& api = tess_->api;
    api.SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));

    if (api.Recognize(nullptr) != 0) {
        api.Clear();
        throw std::runtime_error("Tesseract recognition failed");
    }

    std::vector<RecognizedToken> tokens;
    std::unique_ptr<tesseract::ResultIterator> it(api.GetIterator());
    if (it) {
        constexpr auto level = tesseract::RIL_WORD;
        do {
            std::unique_ptr<char[]> word(it->GetUTF8Text(level));
            if (!word) continue;
            tokens.push_back({word.get(), static_cast<double>(it->Confidence(level))});
        } while (it->Next(level));
    }

    api.Clear();
    return tokens;
}

}  // namespace wms
