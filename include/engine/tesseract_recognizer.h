#pragma once

#include "engine/native_recognizer.h"
#include <memory>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace multiocr {

/**
 * @brief Tesseract recognizer configuration
 */
struct TesseractConfig {
    std::string tessdataPath;   // empty: TESSDATA_PREFIX / compiled-in default
    int pageSegMode = 3;        // PSM_AUTO
    int dpi = 300;

    void Show() const;
};

/**
 * @brief Native engine backed by the Tesseract C++ API
 *
 * One instance per worker thread; the underlying TessBaseAPI is not shared.
 */
class TesseractRecognizer : public INativeRecognizer {
public:
    explicit TesseractRecognizer(const TesseractConfig& config = TesseractConfig());
    ~TesseractRecognizer() override;

    bool initialize(const std::string& language, std::string& error_msg) override;

    std::vector<RecognizedWord> recognize(const cv::Mat& image,
                                          const std::string& language) override;

    std::string version() const override;

    static RecognizerFactory factory(const TesseractConfig& config);

private:
    bool ensureLanguage(const std::string& language, std::string& error_msg);

    TesseractConfig config_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::string loadedLanguage_;
};

} // namespace multiocr
