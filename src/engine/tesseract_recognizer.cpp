#include "engine/tesseract_recognizer.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>

namespace multiocr {

void TesseractConfig::Show() const {
    std::cout << "Tesseract Config:" << std::endl;
    std::cout << "  Tessdata: " << (tessdataPath.empty() ? "<default>" : tessdataPath) << std::endl;
    std::cout << "  Page seg mode: " << pageSegMode << std::endl;
    std::cout << "  DPI: " << dpi << std::endl;
}

TesseractRecognizer::TesseractRecognizer(const TesseractConfig& config)
    : config_(config)
    , api_(std::make_unique<tesseract::TessBaseAPI>()) {}

TesseractRecognizer::~TesseractRecognizer() {
    if (api_) {
        api_->End();
    }
}

bool TesseractRecognizer::initialize(const std::string& language, std::string& error_msg) {
    return ensureLanguage(language, error_msg);
}

bool TesseractRecognizer::ensureLanguage(const std::string& language, std::string& error_msg) {
    if (!loadedLanguage_.empty() && loadedLanguage_ == language) {
        return true;
    }

    const char* datapath = config_.tessdataPath.empty() ? nullptr : config_.tessdataPath.c_str();
    if (api_->Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        error_msg = "Tesseract failed to load language '" + language + "'";
        loadedLanguage_.clear();
        return false;
    }

    api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(config_.pageSegMode));
    api_->SetVariable("user_defined_dpi", std::to_string(config_.dpi).c_str());
    loadedLanguage_ = language;
    LOG_DEBUG("Tesseract loaded language {}", language);
    return true;
}

std::vector<RecognizedWord> TesseractRecognizer::recognize(const cv::Mat& image,
                                                           const std::string& language) {
    if (image.empty()) {
        throw OCRError(ErrorKind::EngineReportedFailure, "empty image", EngineId::Tesseract);
    }

    std::string error_msg;
    if (!ensureLanguage(language, error_msg)) {
        throw OCRError(ErrorKind::EngineReportedFailure, error_msg, EngineId::Tesseract);
    }

    // Tesseract expects RGB or 8-bit gray
    cv::Mat input;
    if (image.channels() == 3) {
        cv::cvtColor(image, input, cv::COLOR_BGR2RGB);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, input, cv::COLOR_BGRA2RGB);
    } else {
        input = image;
    }
    if (!input.isContinuous()) {
        input = input.clone();
    }

    api_->SetImage(input.data, input.cols, input.rows,
                   input.channels(), static_cast<int>(input.step[0]));

    if (api_->Recognize(nullptr) != 0) {
        api_->Clear();
        throw OCRError(ErrorKind::EngineReportedFailure, "Tesseract recognition failed",
                       EngineId::Tesseract);
    }

    std::vector<RecognizedWord> words;
    std::unique_ptr<tesseract::ResultIterator> iter(api_->GetIterator());
    if (iter) {
        const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
        int blockIndex = -1;
        do {
            if (iter->IsAtBeginningOf(tesseract::RIL_BLOCK)) {
                ++blockIndex;
            }

            std::unique_ptr<char[]> text(iter->GetUTF8Text(level));
            if (!text) continue;

            RecognizedWord word;
            word.text = text.get();
            if (word.text.empty()) continue;

            // Tesseract reports 0-100
            word.confidence = std::max(0.0f, std::min(100.0f, iter->Confidence(level))) / 100.0;
            iter->BoundingBox(level, &word.bbox.x0, &word.bbox.y0, &word.bbox.x1, &word.bbox.y1);
            word.blockIndex = blockIndex;
            words.push_back(std::move(word));
        } while (iter->Next(level));
    }

    api_->Clear();
    return words;
}

std::string TesseractRecognizer::version() const {
    return std::string("tesseract ") + tesseract::TessBaseAPI::Version();
}

RecognizerFactory TesseractRecognizer::factory(const TesseractConfig& config) {
    return [config]() -> std::unique_ptr<INativeRecognizer> {
        return std::make_unique<TesseractRecognizer>(config);
    };
}

} // namespace multiocr
